// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MODERN_ULID_MONOTONIC_H_INCLUDED
#define HEADER_MODERN_ULID_MONOTONIC_H_INCLUDED

#include <modern-ulid/ulid.h>
#include <modern-ulid/entropy.h>

namespace mulid {

    /**
     * Entropy source producing strictly increasing entropy for a single timestamp
     *
     * The first read seeds a 64-bit counter from the underlying source. Each subsequent read
     * increments it. The generator never looks at the current time: whenever the timestamp
     * of the ULIDs being generated changes the caller must either create a new generator or
     * call reset(). A generator whose time is 0 reseeds on every read.
     *
     * Only reads of exactly ulid::entropy_length bytes are supported. The produced entropy has
     * 2 zero bytes followed by the 8 bytes of the counter in big-endian order.
     *
     * This class is not safe for concurrent use.
     */
    class monotonic_entropy final : public entropy_source {
    public:
        /// The underlying source must outlive this object
        monotonic_entropy(uint64_t ms, entropy_source & source) noexcept:
            m_source(&source),
            m_time(ms)
        {}

        /// Uses the system entropy source
        explicit monotonic_entropy(uint64_t ms) noexcept:
            monotonic_entropy(ms, system_entropy())
        {}

        monotonic_entropy(std::chrono::system_clock::time_point when, entropy_source & source) noexcept:
            monotonic_entropy(timestamp(when), source)
        {}

        /**
         * Produces the next entropy value
         *
         * Fails with errc::data_size if dest is not ulid::entropy_length long and with
         * errc::monotonic_overflow if the counter cannot be incremented any more. Errors of the
         * underlying source are passed through. The generator state is unchanged on failure.
         */
        MULID_EXPORTED auto read(std::span<uint8_t> dest, std::error_code & ec) -> size_t override;

        /// Starts a new sequence for a different timestamp. The next read will reseed.
        void reset(uint64_t ms) noexcept {
            m_time = ms;
            m_seeded = false;
        }

        auto time() const noexcept -> uint64_t
            { return m_time; }

    private:
        entropy_source * m_source;
        uint64_t m_time;
        uint64_t m_counter = 0;
        bool m_seeded = false;
    };
}

#endif
