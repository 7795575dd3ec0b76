#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkvault::transfer {

// Keyed exclusive locks. An entry is created on first acquire and evicted
// when the last guard referencing it goes away.
class SessionLockRegistry {
public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        ~Guard();

        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owns_lock() const { return lock_.owns_lock(); }

        // Unlocks early and gives up the entry.
        void release();

    private:
        friend class SessionLockRegistry;

        Guard(SessionLockRegistry* registry, std::string key, std::shared_ptr<std::mutex> mutex);

        SessionLockRegistry* registry_;
        std::string key_;
        std::shared_ptr<std::mutex> mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    SessionLockRegistry() = default;
    SessionLockRegistry(const SessionLockRegistry&) = delete;
    SessionLockRegistry& operator=(const SessionLockRegistry&) = delete;

    Guard acquire(const std::string& key);

    size_t size() const;

private:
    void release_if_unused(const std::string& key);

    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
    mutable std::mutex mutex_;
};

}
