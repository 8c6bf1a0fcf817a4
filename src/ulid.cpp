// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/ulid.h>
#include <modern-ulid/entropy.h>


using namespace mulid;

auto ulid::make(uint64_t ms, entropy_source & entropy, std::error_code & ec) -> ulid {
    ulid ret;
    if (auto err = ret.set_time(ms); err != errc{}) {
        ec = err;
        return ulid();
    }
    ec = read_full(entropy, std::span{ret.bytes}.subspan<ulid::time_length>());
    if (ec)
        return ulid();
    return ret;
}

auto ulid::make(uint64_t ms, entropy_source & entropy) -> ulid {
    std::error_code ec;
    auto ret = ulid::make(ms, entropy, ec);
    if (ec)
        MULID_THROW(std::system_error(ec, "cannot make ulid"));
    return ret;
}

auto ulid::generate() -> ulid {
    return ulid::generate(std::chrono::system_clock::now());
}

auto ulid::generate(std::chrono::system_clock::time_point when) -> ulid {
    return ulid::make(timestamp(when), system_entropy());
}
