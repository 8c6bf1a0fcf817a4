// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_THREADING_H_INCLUDED
#define HEADER_MODERN_ULID_THREADING_H_INCLUDED

#include <modern-ulid/common.h>

#if MULID_MULTITHREADED
    #include <mutex>
#endif


namespace mulid::impl {

    struct null_mutex {
        void lock() {}
        bool try_lock() { return true; }
        void unlock() {}
    };

    #if MULID_MULTITHREADED

        using mutex_if_multithreaded = std::mutex;

    #else

        using mutex_if_multithreaded = null_mutex;

    #endif
}

#endif
