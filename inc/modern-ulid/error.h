// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_ERROR_H_INCLUDED
#define HEADER_MODERN_ULID_ERROR_H_INCLUDED

#include <modern-ulid/common.h>

#include <system_error>

namespace mulid {

    /**
     * Errors reported by this library
     *
     * Value-initialized errc (`errc{}`) means success, the same way it does for `std::errc`
     * in `std::from_chars_result`. All enumerators convert to `std::error_code`.
     */
    enum class errc {
        /// Input has the wrong length
        data_size = 1,
        /// Destination buffer has the wrong length
        buffer_size,
        /// Input contains characters outside of Crockford base32 alphabet
        invalid_characters,
        /// First character of the input is larger than 7 so the value cannot fit in 128 bits
        overflow,
        /// Timestamp does not fit in 48 bits
        time_too_large,
        /// Incrementing monotonic entropy would wrap around
        monotonic_overflow,
        /// Unsupported source type passed to a database scan
        scan_value
    };

    /// The error category for errc
    MULID_EXPORTED auto ulid_category() noexcept -> const std::error_category &;

    inline auto make_error_code(errc e) noexcept -> std::error_code {
        return std::error_code(int(e), ulid_category());
    }
}

template<>
struct std::is_error_code_enum<mulid::errc> : std::true_type {};

#endif
