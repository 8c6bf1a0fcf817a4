// Copyright (c) 2024, Eugene Gershnik
// SPDX-License-Identifier: BSD-3-Clause

#include <modern-ulid/string_cache.h>

#include "threading.h"

#include <mutex>
#include <deque>
#include <unordered_map>

using namespace mulid;

struct string_cache::state {
    mutable impl::mutex_if_multithreaded mutex;
    std::unordered_map<ulid, std::string> strings;
    std::deque<ulid> order;
};

string_cache::string_cache(size_t capacity):
    m_capacity(capacity),
    m_state(std::make_unique<state>())
{}

string_cache::~string_cache() noexcept = default;

auto string_cache::to_string(const ulid & val) -> std::string {
    if (m_capacity == 0)
        return val.to_string();

    {
        std::lock_guard guard{m_state->mutex};
        if (auto it = m_state->strings.find(val); it != m_state->strings.end())
            return it->second;
    }

    //render outside of the lock
    auto ret = val.to_string();

    std::lock_guard guard{m_state->mutex};
    if (m_state->strings.try_emplace(val, ret).second) {
        m_state->order.push_back(val);
        if (m_state->order.size() > m_capacity) {
            m_state->strings.erase(m_state->order.front());
            m_state->order.pop_front();
        }
    }
    return ret;
}

auto string_cache::size() const -> size_t {
    std::lock_guard guard{m_state->mutex};
    return m_state->strings.size();
}

void string_cache::clear() {
    std::lock_guard guard{m_state->mutex};
    m_state->strings.clear();
    m_state->order.clear();
}
