// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_SQL_H_INCLUDED
#define HEADER_MODERN_ULID_SQL_H_INCLUDED

#include <modern-ulid/ulid.h>

#include <variant>

namespace mulid {

    /**
     * A column value as handed over by a database driver
     *
     * `nullptr` stands for SQL NULL.
     */
    using sql_scan_source = std::variant<std::nullptr_t,
                                         std::string_view,
                                         std::span<const uint8_t>,
                                         int64_t,
                                         double,
                                         bool>;

    /**
     * Reads a ULID from a database column value
     *
     * Strings and byte sequences are parsed as the textual form (see ulid::parse()). NULL leaves
     * `dest` untouched and succeeds. Any other type fails with errc::scan_value.
     */
    MULID_EXPORTED auto scan(const sql_scan_source & src, ulid & dest) noexcept -> errc;

    /// Returns the value to store in a database column: the uppercase textual form
    MULID_EXPORTED auto sql_value(const ulid & val) -> std::string;
}

#endif
