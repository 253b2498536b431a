/**
 * @file test_flow_controller.cpp
 * @brief Unit tests for BasicFlowController
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <nsqsub/core/flow_controller.hpp>

#include "support/fake_connection.hpp"

#include <memory>

using namespace nsqsub::core;
using nsqsub::test::FakeConnection;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using namespace std::chrono_literals;

class FlowControllerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeConnection> makeConnection(uint16_t port) {
        ConnectionParams params;
        params.host = "127.0.0.1";
        params.port = port;
        return std::make_shared<FakeConnection>(params);
    }

    std::shared_ptr<BasicFlowController> flow =
        std::make_shared<BasicFlowController>(10, 128s);
};

TEST_F(FlowControllerTest, ExposesLimits) {
    EXPECT_EQ(flow->maxInFlight(), 10u);
    EXPECT_EQ(flow->maxBackoffDuration(), 128s);
    EXPECT_FALSE(flow->isPaused());
}

TEST_F(FlowControllerTest, ReadyAssignedOnConnect) {
    auto conn = makeConnection(4150);
    flow->addConnection(conn);
    EXPECT_THAT(conn->readyHistory, IsEmpty());

    conn->emitConnected();

    EXPECT_THAT(conn->readyHistory, ElementsAre(10u));
}

TEST_F(FlowControllerTest, ReadySplitAcrossConnections) {
    auto a = makeConnection(4150);
    auto b = makeConnection(4151);
    flow->addConnection(a);
    flow->addConnection(b);

    a->emitConnected();
    b->emitConnected();

    EXPECT_EQ(a->lastReady(), 5u);
    EXPECT_EQ(b->lastReady(), 5u);
    EXPECT_EQ(flow->connectionCount(), 2u);
}

TEST_F(FlowControllerTest, ReadyNeverBelowOneWhileUnpaused) {
    auto small = std::make_shared<BasicFlowController>(1, 128s);
    auto a = makeConnection(4150);
    auto b = makeConnection(4151);
    small->addConnection(a);
    small->addConnection(b);

    a->emitConnected();
    b->emitConnected();

    EXPECT_EQ(a->lastReady(), 1u);
    EXPECT_EQ(b->lastReady(), 1u);
}

TEST_F(FlowControllerTest, PauseSetsReadyToZero) {
    auto conn = makeConnection(4150);
    flow->addConnection(conn);
    conn->emitConnected();

    flow->pause();
    EXPECT_TRUE(flow->isPaused());
    EXPECT_EQ(conn->lastReady(), 0u);

    flow->unpause();
    EXPECT_FALSE(flow->isPaused());
    EXPECT_EQ(conn->lastReady(), 10u);
}

TEST_F(FlowControllerTest, PauseIsIdempotent) {
    auto conn = makeConnection(4150);
    flow->addConnection(conn);
    conn->emitConnected();

    flow->pause();
    flow->pause();
    flow->unpause();
    flow->unpause();

    EXPECT_THAT(conn->readyHistory, ElementsAre(10u, 0u, 10u));
}

TEST_F(FlowControllerTest, ConnectWhilePausedGetsZero) {
    flow->pause();
    auto conn = makeConnection(4150);
    flow->addConnection(conn);

    conn->emitConnected();

    EXPECT_EQ(conn->lastReady(), 0u);
}

TEST_F(FlowControllerTest, ClosedConnectionReleasesShare) {
    auto a = makeConnection(4150);
    auto b = makeConnection(4151);
    flow->addConnection(a);
    flow->addConnection(b);
    a->emitConnected();
    b->emitConnected();

    b->emitClosed();

    EXPECT_EQ(flow->connectionCount(), 1u);
    EXPECT_EQ(a->lastReady(), 10u);
}

TEST_F(FlowControllerTest, RemoveConnectionIsIdempotent) {
    auto a = makeConnection(4150);
    auto b = makeConnection(4151);
    flow->addConnection(a);
    flow->addConnection(b);
    a->emitConnected();
    b->emitConnected();

    flow->removeConnection(b.get());
    EXPECT_EQ(flow->connectionCount(), 1u);
    EXPECT_EQ(a->lastReady(), 10u);
    size_t grants = a->readyHistory.size();

    // The connection's own close event arrives afterwards
    b->emitClosed();
    flow->removeConnection(b.get());

    EXPECT_EQ(flow->connectionCount(), 1u);
    EXPECT_EQ(a->readyHistory.size(), grants);
}

TEST_F(FlowControllerTest, CloseClosesEveryConnection) {
    auto a = makeConnection(4150);
    auto b = makeConnection(4151);
    flow->addConnection(a);
    flow->addConnection(b);

    flow->close();

    EXPECT_TRUE(flow->isClosed());
    EXPECT_EQ(a->closeCalls, 1);
    EXPECT_EQ(b->closeCalls, 1);
    EXPECT_EQ(flow->connectionCount(), 0u);

    flow->close();
    EXPECT_EQ(a->closeCalls, 1);
}

TEST_F(FlowControllerTest, ConnectionAddedAfterCloseIsClosed) {
    flow->close();
    auto conn = makeConnection(4150);

    flow->addConnection(conn);

    EXPECT_EQ(conn->closeCalls, 1);
    EXPECT_EQ(flow->connectionCount(), 0u);
}
