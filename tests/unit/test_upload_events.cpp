#include <gtest/gtest.h>
#include "chunkvault/transfer/upload_events.hpp"
#include <atomic>
#include <stdexcept>

using namespace chunkvault::transfer;
using namespace std::chrono_literals;

namespace {
    UploadEvent make_event(UploadEventType type, const std::string& file_id) {
        UploadEvent event;
        event.type = type;
        event.file_id = file_id;
        return event;
    }
}

TEST(UploadEventsTest, TypeNames) {
    EXPECT_STREQ(to_string(UploadEventType::SESSION_STARTED), "session_started");
    EXPECT_STREQ(to_string(UploadEventType::CHUNK_REJECTED), "chunk_rejected");
    EXPECT_STREQ(to_string(UploadEventType::SESSION_CANCELLED), "session_cancelled");
}

TEST(UploadEventsTest, DeliversInOrder) {
    EventDispatcher dispatcher(16);
    std::vector<std::string> seen;
    dispatcher.subscribe([&](const UploadEvent& event) { seen.push_back(event.file_id); });
    dispatcher.start();

    dispatcher.publish(make_event(UploadEventType::SESSION_STARTED, "a"));
    dispatcher.publish(make_event(UploadEventType::CHUNK_ACCEPTED, "b"));
    dispatcher.publish(make_event(UploadEventType::SESSION_COMPLETED, "c"));

    ASSERT_TRUE(dispatcher.flush(2s));
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(dispatcher.delivered_count(), 3u);
    EXPECT_EQ(dispatcher.dropped_count(), 0u);

    dispatcher.stop();
}

TEST(UploadEventsTest, EverySubscriberSeesEveryEvent) {
    EventDispatcher dispatcher;
    std::atomic<int> first{0};
    std::atomic<int> second{0};
    dispatcher.subscribe([&](const UploadEvent&) { ++first; });
    dispatcher.subscribe([&](const UploadEvent&) { ++second; });
    dispatcher.start();

    for (int i = 0; i < 10; ++i) {
        dispatcher.publish(make_event(UploadEventType::CHUNK_ACCEPTED, "f"));
    }
    ASSERT_TRUE(dispatcher.flush(2s));

    EXPECT_EQ(first.load(), 10);
    EXPECT_EQ(second.load(), 10);
}

TEST(UploadEventsTest, PublishBeforeStartIsDropped) {
    EventDispatcher dispatcher;
    dispatcher.publish(make_event(UploadEventType::SESSION_STARTED, "early"));
    EXPECT_EQ(dispatcher.dropped_count(), 1u);
    EXPECT_EQ(dispatcher.delivered_count(), 0u);
}

TEST(UploadEventsTest, FullQueueDropsInsteadOfBlocking) {
    EventDispatcher dispatcher(2);
    std::mutex gate;
    std::unique_lock<std::mutex> hold(gate);
    std::atomic<bool> entered{false};

    dispatcher.subscribe([&](const UploadEvent&) {
        entered = true;
        std::lock_guard<std::mutex> wait(gate);
    });
    dispatcher.start();

    // The first event occupies the worker; two more fill the queue.
    dispatcher.publish(make_event(UploadEventType::CHUNK_ACCEPTED, "0"));
    for (int i = 0; i < 200 && !entered; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_TRUE(entered.load());

    dispatcher.publish(make_event(UploadEventType::CHUNK_ACCEPTED, "1"));
    dispatcher.publish(make_event(UploadEventType::CHUNK_ACCEPTED, "2"));
    dispatcher.publish(make_event(UploadEventType::CHUNK_ACCEPTED, "3"));
    EXPECT_EQ(dispatcher.dropped_count(), 1u);

    hold.unlock();
    ASSERT_TRUE(dispatcher.flush(2s));
    EXPECT_EQ(dispatcher.delivered_count(), 3u);
}

TEST(UploadEventsTest, ThrowingSubscriberDoesNotStopDelivery) {
    EventDispatcher dispatcher;
    std::atomic<int> reached{0};
    dispatcher.subscribe([](const UploadEvent&) { throw std::runtime_error("subscriber broke"); });
    dispatcher.subscribe([&](const UploadEvent&) { ++reached; });
    dispatcher.start();

    dispatcher.publish(make_event(UploadEventType::SESSION_FAILED, "x"));
    dispatcher.publish(make_event(UploadEventType::SESSION_FAILED, "y"));
    ASSERT_TRUE(dispatcher.flush(2s));

    EXPECT_EQ(reached.load(), 2);
    EXPECT_EQ(dispatcher.delivered_count(), 2u);
}

TEST(UploadEventsTest, StopDrainsQueuedEvents) {
    EventDispatcher dispatcher;
    std::atomic<int> count{0};
    dispatcher.subscribe([&](const UploadEvent&) {
        std::this_thread::sleep_for(1ms);
        ++count;
    });
    dispatcher.start();

    for (int i = 0; i < 20; ++i) {
        dispatcher.publish(make_event(UploadEventType::CHUNK_ACCEPTED, "f"));
    }
    dispatcher.stop();

    EXPECT_EQ(count.load(), 20);

    dispatcher.publish(make_event(UploadEventType::CHUNK_ACCEPTED, "late"));
    EXPECT_EQ(dispatcher.dropped_count(), 1u);
}
