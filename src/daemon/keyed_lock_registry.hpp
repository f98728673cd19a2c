#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace tracedeck {

// Lazily creates one mutex per key. The registry lock is only held while
// looking up or inserting a key's mutex, never while the caller holds it.
class KeyedLockRegistry {
public:
    std::shared_ptr<std::mutex> lockFor(const std::string &key)
    {
        std::lock_guard<std::mutex> guard(m_registryMutex);
        auto &slot = m_locks[key];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        return slot;
    }

    // Drops the key's mutex when nobody else holds a reference to it.
    void release(const std::string &key)
    {
        std::lock_guard<std::mutex> guard(m_registryMutex);
        const auto it = m_locks.find(key);
        if (it != m_locks.end() && it->second.use_count() == 1) {
            m_locks.erase(it);
        }
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> guard(m_registryMutex);
        return m_locks.size();
    }

private:
    mutable std::mutex m_registryMutex;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> m_locks;
};

// Holds one key's mutex for its lifetime and hands the key back to the
// registry afterwards, also when the guarded work throws.
class KeyedLockGuard {
public:
    KeyedLockGuard(KeyedLockRegistry &registry, std::string key)
        : m_registry(registry)
        , m_key(std::move(key))
        , m_mutex(registry.lockFor(m_key))
    {
        m_mutex->lock();
    }

    ~KeyedLockGuard()
    {
        m_mutex->unlock();
        m_mutex.reset();
        m_registry.release(m_key);
    }

    KeyedLockGuard(const KeyedLockGuard &) = delete;
    KeyedLockGuard &operator=(const KeyedLockGuard &) = delete;

private:
    KeyedLockRegistry &m_registry;
    std::string m_key;
    std::shared_ptr<std::mutex> m_mutex;
};

} // namespace tracedeck
