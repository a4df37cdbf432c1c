#include <gtest/gtest.h>
#include "fcat/events/event_bus.hpp"
#include "fcat/events/events.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fcat::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::string received;
    bus.subscribe<SyncStartedEvent>([&](const SyncStartedEvent& e) {
        received = e.source_path;
    });

    bus.emit(SyncStartedEvent{"case-1", "/evidence"});

    EXPECT_EQ(received, "/evidence");
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;

    int started = 0;
    int completed = 0;
    bus.subscribe<SyncStartedEvent>([&](const SyncStartedEvent&) { started++; });
    bus.subscribe<SyncCompletedEvent>([&](const SyncCompletedEvent&) { completed++; });

    bus.emit(SyncStartedEvent{"case-1", "/a"});
    bus.emit(SyncCompletedEvent{});
    bus.emit(SyncStartedEvent{"case-1", "/b"});

    EXPECT_EQ(started, 2);
    EXPECT_EQ(completed, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<SyncStartedEvent>([&](const SyncStartedEvent&) { count++; });

    bus.emit(SyncStartedEvent{});
    bus.unsubscribe<SyncStartedEvent>(id);
    bus.emit(SyncStartedEvent{});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<SyncStartedEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int after = 0;
    bus.subscribe<EntriesSoftDeletedEvent>([](const EntriesSoftDeletedEvent&) {
        throw std::runtime_error("subscriber failure");
    });
    bus.subscribe<EntriesSoftDeletedEvent>([&](const EntriesSoftDeletedEvent&) { after++; });

    EXPECT_NO_THROW(bus.emit(EntriesSoftDeletedEvent{}));
    EXPECT_EQ(after, 1);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;

    int late_calls = 0;
    bus.subscribe<SyncStartedEvent>([&](const SyncStartedEvent&) {
        bus.subscribe<SyncCompletedEvent>([&](const SyncCompletedEvent&) { late_calls++; });
    });

    bus.emit(SyncStartedEvent{});
    bus.emit(SyncCompletedEvent{});

    EXPECT_EQ(late_calls, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<SyncCompletedEvent>([&count](const SyncCompletedEvent& e) {
        count += static_cast<int>(e.files_inserted);
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            SyncCompletedEvent event;
            event.files_inserted = 1;
            bus.emit(event);
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 50);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<SyncStartedEvent>([](const SyncStartedEvent&) {});
    bus.subscribe<SyncCompletedEvent>([](const SyncCompletedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<SyncStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<SyncCompletedEvent>(), 0u);
}
