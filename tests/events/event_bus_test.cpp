#include <gtest/gtest.h>
#include "dirsync/events/event_bus.hpp"
#include "dirsync/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace dirsync::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::string received_path;

    bus.subscribe<ActionFailedEvent>([&](const ActionFailedEvent& e) {
        handler_called = true;
        received_path = e.path;
    });

    bus.emit(ActionFailedEvent{"docs/a.txt", dirsync::snapshot::FileAction::Upload, "refused"});

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_path, "docs/a.txt");
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;

    bus.subscribe<QueuePreparedEvent>([&](const QueuePreparedEvent&) { count++; });
    bus.subscribe<QueuePreparedEvent>([&](const QueuePreparedEvent&) { count++; });
    bus.subscribe<QueuePreparedEvent>([&](const QueuePreparedEvent&) { count++; });

    bus.emit(QueuePreparedEvent{"q", 0});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int refreshed = 0;
    int failed = 0;

    bus.subscribe<SnapshotRefreshedEvent>([&](const SnapshotRefreshedEvent&) { refreshed++; });
    bus.subscribe<SnapshotRefreshFailedEvent>([&](const SnapshotRefreshFailedEvent&) { failed++; });

    bus.emit(SnapshotRefreshedEvent{3});
    bus.emit(SnapshotRefreshFailedEvent{"disk full"});
    bus.emit(SnapshotRefreshedEvent{4});

    EXPECT_EQ(refreshed, 2);
    EXPECT_EQ(failed, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<QueuePreparedEvent>([&](const QueuePreparedEvent&) { count++; });

    bus.emit(QueuePreparedEvent{"q", 1});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<QueuePreparedEvent>(id);

    bus.emit(QueuePreparedEvent{"q", 2});
    EXPECT_EQ(count, 1);  // Still 1, handler was removed
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;

    EXPECT_NO_THROW(bus.emit(QueuePreparedEvent{"q", 0}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<CycleFailedEvent>([](const CycleFailedEvent&) {
        throw std::runtime_error("observer broke");
    });
    bus.subscribe<CycleFailedEvent>([&](const CycleFailedEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(CycleFailedEvent{"client", "submitting", "timeout"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<SnapshotRefreshedEvent>([&count](const SnapshotRefreshedEvent& e) {
        count += static_cast<int>(e.entries);
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(SnapshotRefreshedEvent{1});
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 100);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<UnknownActionEvent>(), 0u);

    auto id1 = bus.subscribe<UnknownActionEvent>([](const UnknownActionEvent&) {});
    bus.subscribe<UnknownActionEvent>([](const UnknownActionEvent&) {});
    bus.subscribe<CycleCompletedEvent>([](const CycleCompletedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<UnknownActionEvent>(), 2u);

    bus.unsubscribe<UnknownActionEvent>(id1);
    EXPECT_EQ(bus.subscriber_count<UnknownActionEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<UnknownActionEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<CycleCompletedEvent>(), 0u);
}

TEST(EventBus, HandlerMaySubscribeWhileEmitting) {
    EventBus bus;
    int late_calls = 0;

    bus.subscribe<ActionFailedEvent>([&](const ActionFailedEvent&) {
        bus.subscribe<ActionFailedEvent>([&](const ActionFailedEvent&) { ++late_calls; });
    });

    bus.emit(ActionFailedEvent{"a", dirsync::snapshot::FileAction::Upload, "x"});
    EXPECT_EQ(late_calls, 0);
    EXPECT_EQ(bus.subscriber_count<ActionFailedEvent>(), 2u);

    bus.emit(ActionFailedEvent{"a", dirsync::snapshot::FileAction::Upload, "x"});
    EXPECT_EQ(late_calls, 1);
}
