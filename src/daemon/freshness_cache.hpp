#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "daemon/keyed_lock_registry.hpp"

namespace tracedeck {

/**
 * FreshnessCache memoizes one result per key for a short validity window
 * and lets at most one caller compute a given key at a time. Callers that
 * race on the same key block on that key's mutex and pick up the result
 * the winner stored. Different keys never wait on each other.
 */
template <typename Result>
class FreshnessCache {
public:
    using Clock = std::chrono::steady_clock;

    explicit FreshnessCache(std::chrono::milliseconds validity = std::chrono::milliseconds(100))
        : m_validity(validity)
    {
    }

    Result getOrCompute(const std::string &key, const std::function<Result()> &compute)
    {
        if (auto cached = lookupFresh(key)) {
            return *cached;
        }

        KeyedLockGuard guard(m_keyLocks, key);
        std::optional<Result> result = lookupFresh(key);
        if (!result) {
            result = compute();
            store(key, *result);
        }
        return *result;
    }

    void invalidate(const std::string &key)
    {
        std::lock_guard<std::mutex> memoGuard(m_memoMutex);
        m_memo.erase(key);
    }

    void clear()
    {
        std::lock_guard<std::mutex> memoGuard(m_memoMutex);
        m_memo.clear();
    }

    std::chrono::milliseconds validity() const
    {
        return m_validity;
    }

    // Keys with a computation currently in progress or waiting.
    std::size_t activeKeyCount() const
    {
        return m_keyLocks.size();
    }

private:
    struct Entry {
        Clock::time_point computedAt;
        Result result;
    };

    // Stores the entry and drops every other expired one.
    void store(const std::string &key, const Result &result)
    {
        const auto now = Clock::now();
        std::lock_guard<std::mutex> memoGuard(m_memoMutex);
        for (auto it = m_memo.begin(); it != m_memo.end();) {
            if (now - it->second.computedAt >= m_validity) {
                it = m_memo.erase(it);
            } else {
                ++it;
            }
        }
        m_memo[key] = Entry{now, result};
    }

    std::optional<Result> lookupFresh(const std::string &key) const
    {
        std::lock_guard<std::mutex> memoGuard(m_memoMutex);
        const auto it = m_memo.find(key);
        if (it == m_memo.end()) {
            return std::nullopt;
        }
        if (Clock::now() - it->second.computedAt >= m_validity) {
            return std::nullopt;
        }
        return it->second.result;
    }

    std::chrono::milliseconds m_validity;
    mutable std::mutex m_memoMutex;
    std::unordered_map<std::string, Entry> m_memo;
    KeyedLockRegistry m_keyLocks;
};

} // namespace tracedeck
