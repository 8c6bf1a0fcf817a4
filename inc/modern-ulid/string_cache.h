// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_STRING_CACHE_H_INCLUDED
#define HEADER_MODERN_ULID_STRING_CACHE_H_INCLUDED

#include <modern-ulid/ulid.h>

#include <memory>

namespace mulid {

    /**
     * Bounded memoization of ulid::to_string()
     *
     * Returns exactly what ulid::to_string(ulid::uppercase) would. Once `capacity` entries are
     * stored the oldest one is evicted. A capacity of 0 disables caching.
     *
     * All methods are safe to call concurrently.
     */
    class string_cache {
    public:
        MULID_EXPORTED explicit string_cache(size_t capacity);
        MULID_EXPORTED ~string_cache() noexcept;
        string_cache(const string_cache &) = delete;
        string_cache & operator=(const string_cache &) = delete;

        MULID_EXPORTED auto to_string(const ulid & val) -> std::string;

        MULID_EXPORTED auto size() const -> size_t;
        auto capacity() const noexcept -> size_t
            { return m_capacity; }

        MULID_EXPORTED void clear();
    private:
        struct state;

        size_t m_capacity;
        std::unique_ptr<state> m_state;
    };
}

#endif
