// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_ENTROPY_H_INCLUDED
#define HEADER_MODERN_ULID_ENTROPY_H_INCLUDED

#include <modern-ulid/error.h>

namespace mulid {

    /// Callback interface to supply random bytes for ULID generation
    class entropy_source {
    public:
        /**
         * Reads up to `dest.size()` random bytes into dest.
         *
         * @returns number of bytes read. On failure `ec` is set to the error and the return value
         * is the number of bytes read before the failure occurred.
         */
        virtual auto read(std::span<uint8_t> dest, std::error_code & ec) -> size_t = 0;
    protected:
        entropy_source() noexcept = default;
        ~entropy_source() noexcept = default;
        entropy_source(const entropy_source &) noexcept = default;
        entropy_source & operator=(const entropy_source &) noexcept = default;
    };

    /**
     * Reads from source until dest is completely filled.
     *
     * A read that makes no progress without reporting an error is treated as
     * std::errc::io_error.
     */
    MULID_EXPORTED auto read_full(entropy_source & source, std::span<uint8_t> dest) -> std::error_code;

    /**
     * Returns the cryptographically secure entropy source of the operating system.
     *
     * The returned object is stateless and safe to use concurrently from multiple threads.
     */
    MULID_EXPORTED auto system_entropy() noexcept -> entropy_source &;
}

#endif
