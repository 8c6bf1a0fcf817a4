// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <doctest/doctest.h>

#include <fmt/format.h>
#include <modern-ulid/ulid.h>

using namespace mulid;
using namespace std::literals;

static_assert(MULID_SUPPORTS_FMT_FORMAT);

TEST_SUITE("fmt") {

TEST_CASE("format") {

    CHECK(fmt::format("{}", ulid()) == "00000000000000000000000000");
    CHECK(fmt::format("{}", ulid("01BX5ZZKBKACTAV9WEVGEMMVRY")) == "01BX5ZZKBKACTAV9WEVGEMMVRY");
    CHECK(fmt::format("{:l}", ulid("01BX5ZZKBKACTAV9WEVGEMMVRY")) == "01bx5zzkbkactav9wevgemmvry");
    CHECK(fmt::format("{:u}", ulid("01bx5zzkbkactav9wevgemmvry")) == "01BX5ZZKBKACTAV9WEVGEMMVRY");
    CHECK(fmt::format("[{}]", ulid::max()) == "[7ZZZZZZZZZZZZZZZZZZZZZZZZZ]");
}

}
