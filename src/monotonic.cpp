// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/monotonic.h>

using namespace mulid;

auto monotonic_entropy::read(std::span<uint8_t> dest, std::error_code & ec) -> size_t {
    if (dest.size() != ulid::entropy_length) {
        ec = errc::data_size;
        return 0;
    }

    uint64_t next;
    if (!m_seeded || m_time == 0) {
        uint8_t seed[sizeof(uint64_t)];
        ec = read_full(*m_source, seed);
        if (ec)
            return 0;
        impl::read_bytes(seed, next);
        m_seeded = true;
    } else {
        if (m_counter == std::numeric_limits<uint64_t>::max()) {
            ec = errc::monotonic_overflow;
            return 0;
        }
        next = m_counter + 1;
    }
    m_counter = next;

    constexpr size_t padding = ulid::entropy_length - sizeof(uint64_t);
    std::fill(dest.begin(), dest.begin() + padding, uint8_t(0));
    impl::write_bytes(m_counter, dest.data() + padding);

    ec.clear();
    return ulid::entropy_length;
}
