// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/base32.h>

#include "test_util.h"

using namespace mulid;
using namespace std::literals;

using impl::base32_alphabet;
using impl::base32;

TEST_SUITE("base32") {

static_assert(base32_alphabet::size == 32);
static_assert(base32::binary_size == 16);
static_assert(base32::text_size == 26);

static_assert(base32_alphabet::encode<char>(true, 0) == '0');
static_assert(base32_alphabet::encode<char>(true, 31) == 'Z');
static_assert(base32_alphabet::encode<char>(false, 31) == 'z');
static_assert(base32_alphabet::encode<char>(false, 18) == 'j');
static_assert(base32_alphabet::encode<wchar_t>(true, 10) == L'A');
static_assert(base32_alphabet::encode<char32_t>(false, 10) == U'a');

static_assert(base32_alphabet::decode('0') == 0);
static_assert(base32_alphabet::decode('z') == 31);
static_assert(base32_alphabet::decode('Z') == 31);
static_assert(base32_alphabet::decode(u'h') == 17);
static_assert(base32_alphabet::decode(U'J') == 18);

TEST_CASE("alphabet") {
    std::string_view upper = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
    std::string_view lower = "0123456789abcdefghjkmnpqrstvwxyz";

    for (uint8_t i = 0; i < 32; ++i) {
        CHECK(base32_alphabet::encode<char>(true, i) == upper[i]);
        CHECK(base32_alphabet::encode<char>(false, i) == lower[i]);
        CHECK(base32_alphabet::encode<char8_t>(true, i) == char8_t(upper[i]));
        CHECK(base32_alphabet::encode<wchar_t>(false, i) == wchar_t(lower[i]));
        CHECK(base32_alphabet::decode(upper[i]) == i);
        CHECK(base32_alphabet::decode(lower[i]) == i);
        CHECK(base32_alphabet::decode(char16_t(upper[i])) == i);
        CHECK(base32_alphabet::decode(char32_t(lower[i])) == i);
    }

    for (int c = 0; c < 256; ++c) {
        if (upper.find(char(c)) != upper.npos || lower.find(char(c)) != lower.npos)
            continue;
        CHECK(base32_alphabet::decode(char(c)) == base32_alphabet::invalid);
        CHECK(base32_alphabet::decode(char32_t(c)) == base32_alphabet::invalid);
    }
}

TEST_CASE("no aliases") {
    for (char c: "IiLlOoUu"sv) {
        CHECK(base32_alphabet::decode(c) == base32_alphabet::invalid);
        CHECK(base32_alphabet::decode(wchar_t(c)) == base32_alphabet::invalid);
    }
}

TEST_CASE("wide code points") {
    //code points that would alias alphabet characters if truncated to 8 bits
    CHECK(base32_alphabet::decode(char16_t(0x100 + 'A')) == base32_alphabet::invalid);
    CHECK(base32_alphabet::decode(char32_t(0x10000 + '0')) == base32_alphabet::invalid);
    CHECK(base32_alphabet::decode(wchar_t(0x200 + 'z')) == base32_alphabet::invalid);
}

TEST_CASE("encode") {
    constexpr std::array<uint8_t, 16> bytes =
        {0x01,0x56,0x3d,0xf3,0x64,0x81, 0xF7,0xBD,0xEF,0x7B,0xDE,0xF7,0xBD,0xEF,0x7B,0xDE};

    std::array<char, 26> buf;
    base32::encode(bytes, buf.data(), true);
    CHECK(std::string_view(buf.data(), buf.size()) == "01ARYZ6S41YYYYYYYYYYYYYYYY");
    base32::encode(bytes, buf.data(), false);
    CHECK(std::string_view(buf.data(), buf.size()) == "01aryz6s41yyyyyyyyyyyyyyyy");

    std::array<uint8_t, 16> ones;
    ones.fill(0xFF);
    base32::encode(ones, buf.data(), true);
    CHECK(std::string_view(buf.data(), buf.size()) == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");

    std::array<uint8_t, 16> zeros{};
    std::array<char16_t, 26> wbuf;
    base32::encode(zeros, wbuf.data(), true);
    CHECK(std::u16string_view(wbuf.data(), wbuf.size()) == u"00000000000000000000000000");
}

TEST_CASE("decode") {
    constexpr std::array<uint8_t, 16> expected =
        {0x01,0x5f,0x4b,0xff,0xcd,0x73, 0x53,0x34,0xad,0xa7,0x8e,0xdc,0x1d,0x4a,0x6f,0x1e};

    std::array<uint8_t, 16> dst{};
    CHECK(base32::decode("01BX5ZZKBKACTAV9WEVGEMMVRY", dst, true) == errc{});
    CHECK(dst == expected);

    dst.fill(0);
    CHECK(base32::decode(L"01bx5zzkbkactav9wevgemmvry", dst, false) == errc{});
    CHECK(dst == expected);

    dst.fill(0);
    CHECK(base32::decode(U"01bX5zZkBkAcTaV9wEvGeMmVrY", dst, true) == errc{});
    CHECK(dst == expected);
}

TEST_CASE("decode failure leaves destination alone") {
    std::array<uint8_t, 16> dst;
    dst.fill(0xAB);
    std::array<uint8_t, 16> orig = dst;

    CHECK(base32::decode("8ZZZZZZZZZZZZZZZZZZZZZZZZZ", dst, false) == errc::overflow);
    CHECK(dst == orig);
    CHECK(base32::decode("0ZZZZZZZZ!ZZZZZZZZZZZZZZZZ", dst, false) == errc::invalid_characters);
    CHECK(dst == orig);
    CHECK(base32::decode("0ZZZZZZZZZZZZZZZZZZZZZZZZ!", dst, true) == errc::invalid_characters);
    CHECK(dst == orig);
}

}
