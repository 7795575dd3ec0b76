#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chunkvault::transfer {

enum class UploadEventType {
    SESSION_STARTED,
    CHUNK_ACCEPTED,
    CHUNK_REJECTED,
    MERGE_STARTED,
    SESSION_COMPLETED,
    SESSION_FAILED,
    SESSION_CANCELLED
};

const char* to_string(UploadEventType type);

struct UploadEvent {
    UploadEventType type;
    std::string file_id;
    std::string owner_id;
    std::optional<uint32_t> chunk_number;
    std::string reason;
    uint64_t final_size = 0;
    std::string final_hash;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// Fire-and-forget sink. publish() must never block the caller.
class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    virtual void publish(const UploadEvent& event) = 0;
};

// Bounded queue drained by one worker thread. Events are dropped when the queue is full.
class EventDispatcher : public NotificationChannel {
public:
    using Subscriber = std::function<void(const UploadEvent&)>;

    explicit EventDispatcher(size_t capacity = 1024);
    ~EventDispatcher() override;

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    void start();
    // Delivers what is already queued, then joins the worker.
    void stop();

    void subscribe(Subscriber subscriber);

    void publish(const UploadEvent& event) override;

    // Waits until every queued event has been delivered.
    bool flush(std::chrono::milliseconds timeout);

    uint64_t delivered_count() const;
    uint64_t dropped_count() const;

private:
    void run();

    size_t capacity_;
    std::deque<UploadEvent> queue_;
    std::vector<Subscriber> subscribers_;

    bool running_;
    bool delivering_;
    uint64_t delivered_;
    uint64_t dropped_;

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::thread worker_;
};

}
