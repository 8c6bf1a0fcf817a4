// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#ifndef HEADER_MULID_TEST_UTIL_H_INCLUDED
#define HEADER_MULID_TEST_UTIL_H_INCLUDED

#include <doctest/doctest.h>

#include <modern-ulid/entropy.h>

#include <array>
#include <vector>
#include <initializer_list>

namespace std {
    
    template<class T, size_t N>
    doctest::String toString(const std::array<T, N> & arr) {
        using doctest::toString;

        if constexpr (std::is_same_v<std::remove_const_t<T>, char>) {
            return toString(std::string_view(arr.data(), arr.size()));
        } else {
            doctest::String ret = "[";
            for (size_t i = 0; i < N; ++i) {
                if (i > 0)
                    ret += ", ";
                ret += toString(arr[i]);
            }
            ret += "]";
            return ret;
        }
    }
}

//Returns preset bytes, at most `chunk` per read. Reads nothing once exhausted.
class fixed_entropy final : public mulid::entropy_source {
public:
    fixed_entropy(std::initializer_list<uint8_t> data, size_t chunk = std::numeric_limits<size_t>::max()):
        m_data(data),
        m_chunk(chunk)
    {}

    auto read(std::span<uint8_t> dest, std::error_code & ec) -> size_t override {
        ec.clear();
        size_t count = std::min({dest.size(), m_data.size() - m_pos, m_chunk});
        std::copy(m_data.begin() + m_pos, m_data.begin() + m_pos + count, dest.begin());
        m_pos += count;
        ++m_reads;
        return count;
    }

    auto remaining() const -> size_t
        { return m_data.size() - m_pos; }
    auto reads() const -> size_t
        { return m_reads; }
private:
    std::vector<uint8_t> m_data;
    size_t m_chunk;
    size_t m_pos = 0;
    size_t m_reads = 0;
};

class failing_entropy final : public mulid::entropy_source {
public:
    auto read(std::span<uint8_t>, std::error_code & ec) -> size_t override {
        ec = std::make_error_code(std::errc::operation_not_permitted);
        return 0;
    }
};

#endif
