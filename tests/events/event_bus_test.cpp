#include <gtest/gtest.h>
#include "cbu/events/event_bus.hpp"
#include "cbu/events/events.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace cbu::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    std::uint64_t confirmed = 0;
    bus.subscribe<ChunkAcceptedEvent>([&](const ChunkAcceptedEvent& e) {
        confirmed = e.confirmed_bytes;
    });

    bus.emit(ChunkAcceptedEvent{"signal.backup", 1024, 4096, 8192});

    EXPECT_EQ(confirmed, 4096u);
}

TEST(EventBus, DeliversOnlyToMatchingType) {
    EventBus bus;

    int started = 0;
    int failed = 0;
    bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent&) { started++; });
    bus.subscribe<UploadFailedEvent>([&](const UploadFailedEvent&) { failed++; });

    bus.emit(UploadStartedEvent{"a.backup", 10});
    bus.emit(UploadStartedEvent{"b.backup", 20});
    bus.emit(UploadFailedEvent{"a.backup", cbu::make_error(cbu::ErrorKind::TransientNetworkOrServer, "x")});

    EXPECT_EQ(started, 2);
    EXPECT_EQ(failed, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent&) { count++; });

    bus.emit(UploadStartedEvent{"a.backup", 1});
    bus.unsubscribe<UploadStartedEvent>(id);
    bus.emit(UploadStartedEvent{"a.backup", 1});

    EXPECT_EQ(count, 1);
}

TEST(EventBus, UnsubscribeWithOtherTypeIsIgnored) {
    EventBus bus;

    int started = 0;
    auto id = bus.subscribe<UploadStartedEvent>([&](const UploadStartedEvent&) { started++; });

    bus.unsubscribe<UploadFailedEvent>(id);
    bus.unsubscribe<UploadStartedEvent>(id + 100);
    bus.emit(UploadStartedEvent{"a.backup", 10});

    EXPECT_EQ(started, 1);
    EXPECT_EQ(bus.subscriber_count<UploadStartedEvent>(), 1u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int reached = 0;
    bus.subscribe<SessionDiscardedEvent>([](const SessionDiscardedEvent&) {
        throw std::runtime_error("handler failure");
    });
    bus.subscribe<SessionDiscardedEvent>([&](const SessionDiscardedEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(SessionDiscardedEvent{"a.backup", "session expired"}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(ConsentRequiredEvent{"Bearer realm=\"drive\""}));
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<ChunkAcceptedEvent>([&bytes](const ChunkAcceptedEvent& e) {
        bytes += e.chunk_bytes;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([&bus]() {
            bus.emit(ChunkAcceptedEvent{"a.backup", 2, 0, 0});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 100u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 0u);
    auto id = bus.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent&) {});
    bus.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 2u);

    bus.unsubscribe<UploadCompletedEvent>(id);
    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<UploadCompletedEvent>(), 0u);
}
