// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/sql.h>

#include "test_util.h"

#include <vector>

using namespace mulid;
using namespace std::literals;

TEST_SUITE("sql") {

TEST_CASE("scan text") {
    ulid dest;
    CHECK(scan(sql_scan_source("01ARZ3NDEKTSV4RRFFQ69G5FAV"sv), dest) == errc{});
    CHECK(dest == ulid("01ARZ3NDEKTSV4RRFFQ69G5FAV"));

    CHECK(scan(sql_scan_source("01arz3ndektsv4rrffq69g5fav"sv), dest) == errc{});
    CHECK(dest == ulid("01ARZ3NDEKTSV4RRFFQ69G5FAV"));
}

TEST_CASE("scan bytes") {
    const std::string_view text = "01BX5ZZKBKACTAV9WEVGEMMVRY";
    std::vector<uint8_t> raw(text.begin(), text.end());

    ulid dest;
    CHECK(scan(sql_scan_source(std::span<const uint8_t>(raw)), dest) == errc{});
    CHECK(dest == ulid("01BX5ZZKBKACTAV9WEVGEMMVRY"));
}

TEST_CASE("scan null") {
    ulid dest("01BX5ZZKBKACTAV9WEVGEMMVRY");
    CHECK(scan(sql_scan_source(nullptr), dest) == errc{});
    CHECK(dest == ulid("01BX5ZZKBKACTAV9WEVGEMMVRY"));
}

TEST_CASE("scan errors") {
    const ulid orig("01BX5ZZKBKACTAV9WEVGEMMVRY");
    ulid dest = orig;

    CHECK(scan(sql_scan_source(int64_t(42)), dest) == errc::scan_value);
    CHECK(scan(sql_scan_source(1.5), dest) == errc::scan_value);
    CHECK(scan(sql_scan_source(true), dest) == errc::scan_value);
    CHECK(dest == orig);

    CHECK(scan(sql_scan_source("01BX5ZZKBKACTAV9WEVGEMMVR"sv), dest) == errc::data_size);
    CHECK(scan(sql_scan_source("0!BX5ZZKBKACTAV9WEVGEMMVRY"sv), dest) == errc::invalid_characters);
    CHECK(scan(sql_scan_source("81BX5ZZKBKACTAV9WEVGEMMVRY"sv), dest) == errc::overflow);
    CHECK(scan(sql_scan_source(std::span<const uint8_t>()), dest) == errc::data_size);
    CHECK(dest == orig);

    //binary form is not accepted, only text
    CHECK(scan(sql_scan_source(std::span<const uint8_t>(orig.bytes)), dest) == errc::data_size);
}

TEST_CASE("value") {
    CHECK(sql_value(ulid("01bx5zzkbkactav9wevgemmvry")) == "01BX5ZZKBKACTAV9WEVGEMMVRY");
    CHECK(sql_value(ulid()) == "00000000000000000000000000");

    ulid back;
    CHECK(scan(sql_scan_source(std::string_view(sql_value(ulid::max()))), back) == errc{});
    CHECK(back == ulid::max());
}

}
