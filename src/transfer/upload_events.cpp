#include "chunkvault/transfer/upload_events.hpp"
#include "chunkvault/core/logger.hpp"

namespace chunkvault::transfer {

const char* to_string(UploadEventType type) {
    switch (type) {
        case UploadEventType::SESSION_STARTED: return "session_started";
        case UploadEventType::CHUNK_ACCEPTED: return "chunk_accepted";
        case UploadEventType::CHUNK_REJECTED: return "chunk_rejected";
        case UploadEventType::MERGE_STARTED: return "merge_started";
        case UploadEventType::SESSION_COMPLETED: return "session_completed";
        case UploadEventType::SESSION_FAILED: return "session_failed";
        case UploadEventType::SESSION_CANCELLED: return "session_cancelled";
    }
    return "unknown";
}

EventDispatcher::EventDispatcher(size_t capacity)
    : capacity_(capacity)
    , running_(false)
    , delivering_(false)
    , delivered_(0)
    , dropped_(0) {
}

EventDispatcher::~EventDispatcher() {
    stop();
}

void EventDispatcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread([this]() { run(); });
}

void EventDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    queue_cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

void EventDispatcher::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(std::move(subscriber));
}

void EventDispatcher::publish(const UploadEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || queue_.size() >= capacity_) {
            ++dropped_;
            return;
        }
        queue_.push_back(event);
    }
    queue_cv_.notify_one();
}

bool EventDispatcher::flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return queue_.empty() && !delivering_;
    });
}

uint64_t EventDispatcher::delivered_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

uint64_t EventDispatcher::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void EventDispatcher::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        queue_cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });

        if (queue_.empty()) {
            break;
        }

        auto event = std::move(queue_.front());
        queue_.pop_front();
        auto subscribers = subscribers_;
        delivering_ = true;
        lock.unlock();

        for (const auto& subscriber : subscribers) {
            try {
                subscriber(event);
            } catch (const std::exception& e) {
                LOG_WARN("Event subscriber failed on {}: {}", to_string(event.type), e.what());
            }
        }

        lock.lock();
        delivering_ = false;
        ++delivered_;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }

    idle_cv_.notify_all();
}

}
