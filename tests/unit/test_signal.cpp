/**
 * @file test_signal.cpp
 * @brief Unit tests for Signal listener dispatch
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nsqsub/core/signal.hpp>

#include <string>
#include <vector>

using namespace nsqsub::core;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(SignalTest, DeliversArgumentsToListener) {
    Signal<const std::string&, uint16_t> signal;
    std::string host;
    uint16_t port = 0;

    signal.connect([&](const std::string& h, uint16_t p) {
        host = h;
        port = p;
    });
    signal.emit("127.0.0.1", uint16_t(4150));

    EXPECT_EQ(host, "127.0.0.1");
    EXPECT_EQ(port, 4150);
}

TEST(SignalTest, ListenersRunInRegistrationOrder) {
    Signal<> signal;
    std::vector<int> order;

    signal.connect([&]() { order.push_back(1); });
    signal.connect([&]() { order.push_back(2); });
    signal.connect([&]() { order.push_back(3); });
    signal.emit();

    EXPECT_THAT(order, ElementsAre(1, 2, 3));
}

TEST(SignalTest, DisconnectStopsDelivery) {
    Signal<int> signal;
    std::vector<int> seen;

    SlotId id = signal.connect([&](int v) { seen.push_back(v); });
    signal.emit(1);
    signal.disconnect(id);
    signal.emit(2);

    EXPECT_THAT(seen, ElementsAre(1));
    EXPECT_EQ(signal.listenerCount(), 0u);
}

TEST(SignalTest, DisconnectUnknownIdIsIgnored) {
    Signal<> signal;
    signal.connect([]() {});
    signal.disconnect(999);
    EXPECT_EQ(signal.listenerCount(), 1u);
}

TEST(SignalTest, ListenerAddedDuringEmitWaitsForNextEmit) {
    Signal<> signal;
    int lateCalls = 0;

    signal.connect([&]() {
        signal.connect([&]() { ++lateCalls; });
    });
    signal.emit();
    EXPECT_EQ(lateCalls, 0);

    signal.emit();
    EXPECT_EQ(lateCalls, 1);
}

TEST(SignalTest, ListenerRemovedDuringEmitIsSkipped) {
    Signal<> signal;
    std::vector<int> order;
    SlotId second = 0;

    signal.connect([&]() {
        order.push_back(1);
        signal.disconnect(second);
    });
    second = signal.connect([&]() { order.push_back(2); });
    signal.emit();

    EXPECT_THAT(order, ElementsAre(1));
}

TEST(SignalTest, DisconnectAll) {
    Signal<> signal;
    std::vector<int> order;
    signal.connect([&]() { order.push_back(1); });
    signal.connect([&]() { order.push_back(2); });

    signal.disconnectAll();
    signal.emit();

    EXPECT_THAT(order, IsEmpty());
    EXPECT_EQ(signal.listenerCount(), 0u);
}
