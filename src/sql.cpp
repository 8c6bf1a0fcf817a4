// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/sql.h>

using namespace mulid;

auto mulid::scan(const sql_scan_source & src, ulid & dest) noexcept -> errc {
    return std::visit([&dest](const auto & val) -> errc {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return errc{};
        } else if constexpr (std::is_same_v<T, std::string_view>) {
            return dest.unmarshal_text(val);
        } else if constexpr (std::is_same_v<T, std::span<const uint8_t>>) {
            std::string_view text(reinterpret_cast<const char *>(val.data()), val.size());
            return dest.unmarshal_text(text);
        } else {
            return errc::scan_value;
        }
    }, src);
}

auto mulid::sql_value(const ulid & val) -> std::string {
    return val.to_string(ulid::uppercase);
}
