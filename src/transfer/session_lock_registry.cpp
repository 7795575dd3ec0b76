#include "chunkvault/transfer/session_lock_registry.hpp"

namespace chunkvault::transfer {

SessionLockRegistry::Guard::Guard(SessionLockRegistry* registry, std::string key,
                                  std::shared_ptr<std::mutex> mutex)
    : registry_(registry)
    , key_(std::move(key))
    , mutex_(std::move(mutex))
    , lock_(*mutex_) {
}

SessionLockRegistry::Guard::Guard(Guard&& other) noexcept
    : registry_(other.registry_)
    , key_(std::move(other.key_))
    , mutex_(std::move(other.mutex_))
    , lock_(std::move(other.lock_)) {
    other.registry_ = nullptr;
}

SessionLockRegistry::Guard::~Guard() {
    release();
}

void SessionLockRegistry::Guard::release() {
    if (!registry_) {
        return;
    }

    if (lock_.owns_lock()) {
        lock_.unlock();
    }
    lock_.release();
    mutex_.reset();

    registry_->release_if_unused(key_);
    registry_ = nullptr;
}

SessionLockRegistry::Guard SessionLockRegistry::acquire(const std::string& key) {
    std::shared_ptr<std::mutex> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = locks_[key];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        entry = slot;
    }
    return Guard(this, key, std::move(entry));
}

size_t SessionLockRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return locks_.size();
}

void SessionLockRegistry::release_if_unused(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = locks_.find(key);
    if (it != locks_.end() && it->second.use_count() == 1) {
        locks_.erase(it);
    }
}

}
