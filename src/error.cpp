// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/error.h>

using namespace mulid;

namespace {

    class ulid_category_impl final : public std::error_category {
    public:
        auto name() const noexcept -> const char * override {
            return "ulid";
        }

        auto message(int code) const -> std::string override {
            switch(errc(code)) {
                case errc::data_size:           return "ulid: bad data size when unmarshaling";
                case errc::buffer_size:         return "ulid: bad buffer size when marshaling";
                case errc::invalid_characters:  return "ulid: bad data characters when unmarshaling";
                case errc::overflow:            return "ulid: overflow when unmarshaling";
                case errc::time_too_large:      return "ulid: time too big";
                case errc::monotonic_overflow:  return "ulid: monotonic entropy overflow";
                case errc::scan_value:          return "ulid: source value must be a string or byte sequence";
            }
            if (code == 0)
                return "success";
            return "ulid: unknown error";
        }
    };
}

auto mulid::ulid_category() noexcept -> const std::error_category & {
    static const ulid_category_impl instance;
    return instance;
}
