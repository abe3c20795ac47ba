#include <gtest/gtest.h>
#include "runsync/events/event_bus.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace runsync::events;

// Test event types
struct TestEvent {
    int value;
    std::string message;
};

struct AnotherEvent {
    double data;
};

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    int received_value = 0;
    bus.subscribe<TestEvent>([&](const TestEvent& e) { received_value = e.value; });

    bus.emit(TestEvent{42, "test"});

    EXPECT_EQ(received_value, 42);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int test_count = 0;
    int another_count = 0;

    bus.subscribe<TestEvent>([&](const TestEvent&) { test_count++; });
    bus.subscribe<AnotherEvent>([&](const AnotherEvent&) { another_count++; });

    bus.emit(TestEvent{1, "test"});
    bus.emit(AnotherEvent{3.14});
    bus.emit(TestEvent{2, "test2"});

    EXPECT_EQ(test_count, 2);
    EXPECT_EQ(another_count, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });
    bus.emit(TestEvent{1, "test"});

    bus.unsubscribe<TestEvent>(id);
    bus.emit(TestEvent{2, "test"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int count = 0;
    bus.subscribe<TestEvent>([](const TestEvent&) { throw std::runtime_error("handler failed"); });
    bus.subscribe<TestEvent>([&](const TestEvent&) { count++; });

    EXPECT_NO_THROW(bus.emit(TestEvent{1, "test"}));
    EXPECT_EQ(count, 1);
}

TEST(EventBus, HandlerMayUnsubscribeItself) {
    EventBus bus;

    int count = 0;
    EventBus::HandlerId id = 0;
    id = bus.subscribe<TestEvent>([&](const TestEvent&) {
        count++;
        bus.unsubscribe<TestEvent>(id);
    });

    bus.emit(TestEvent{1, "test"});
    bus.emit(TestEvent{2, "test"});

    EXPECT_EQ(count, 1);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<int> count{0};

    bus.subscribe<TestEvent>([&count](const TestEvent& e) { count += e.value; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 32; ++i) {
        threads.emplace_back([&bus]() { bus.emit(TestEvent{1, "test"}); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(count, 32);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<TestEvent>([](const TestEvent&) {});
    bus.subscribe<AnotherEvent>([](const AnotherEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<AnotherEvent>(), 0u);
}

TEST(SubscriptionSet, UnsubscribesOnDestruction) {
    EventBus bus;
    int count = 0;
    {
        SubscriptionSet subscriptions(bus);
        subscriptions.add<TestEvent>([&](const TestEvent&) { count++; });
        subscriptions.add<AnotherEvent>([&](const AnotherEvent&) { count++; });
        EXPECT_EQ(subscriptions.size(), 2u);

        bus.emit(TestEvent{1, "test"});
        EXPECT_EQ(bus.subscriber_count<TestEvent>(), 1u);
    }

    bus.emit(TestEvent{2, "test"});
    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<TestEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<AnotherEvent>(), 0u);
}
