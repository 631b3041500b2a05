#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "core/GossipBus.hpp"
#include "membership/WireCodec.hpp"

using namespace Gossamer::Core;
using namespace Gossamer::Membership;
using namespace std::chrono_literals;

namespace {
    const NodeId A("a");
    const NodeId B("b");
    const NodeId C("c");

    class GossipBusTest : public ::testing::Test {
    protected:
        NodeMembership membership{A, {A, B}};
        GossipBus bus{membership, {B, C}, 1000ms, GossamerUtils::LogLevel::SILENT};
        std::vector<OutboundMessage> sent;
        std::vector<std::vector<NodeId>> groups;

        void SetUp() override {
            bus.outbound().subscribe([this](const OutboundMessage& m) { sent.push_back(m); });
            bus.groupChanges().subscribe([this](const std::vector<NodeId>& g) { groups.push_back(g); });
        }
    };
}

TEST_F(GossipBusTest, GarbageIsNullRouted) {
    bus.processFrame(InboundFrame{"127.0.0.1:1", "\x07garbage"});

    TelemetrySnapshot s = bus.getTelemetrySnapshot();
    EXPECT_EQ(s.null_routed, 1u);
    EXPECT_EQ(s.accepted, 0u);
    EXPECT_TRUE(sent.empty());
}

TEST_F(GossipBusTest, HeartbeatIsAccepted) {
    bus.processFrame(InboundFrame{"127.0.0.1:1", encodeMessage(Message::makeHeartbeat(B))});

    TelemetrySnapshot s = bus.getTelemetrySnapshot();
    EXPECT_EQ(s.accepted, 1u);
    EXPECT_EQ(s.group_size, 2u);
    EXPECT_EQ(s.graph_events, 1u);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], (std::vector<NodeId>{A, B}));
}

TEST_F(GossipBusTest, ForeignGenesisIsRejected) {
    NodeMembership stranger(B, {B, C});
    bus.processFrame(InboundFrame{"127.0.0.1:2", encodeMessage(stranger.syncMessage())});

    TelemetrySnapshot s = bus.getTelemetrySnapshot();
    EXPECT_EQ(s.rejected, 1u);
    EXPECT_EQ(s.accepted, 0u);
    EXPECT_EQ(membership.graph().size(), 1u);
}

TEST_F(GossipBusTest, ProposalIsAcknowledgedOnTheBus) {
    NodeMembership peer(B, {A, B});
    membership.handleMessage(peer.syncMessage());
    auto proposal = peer.requestAdd(C);

    bus.processFrame(InboundFrame{"127.0.0.1:2", encodeMessage(proposal[0])});

    ASSERT_EQ(sent.size(), 1u);
    EXPECT_FALSE(sent[0].target.has_value());
    Message ack = decodeMessage(sent[0].payload);
    EXPECT_EQ(ack.sender, A);
    ASSERT_EQ(ack.events.size(), 1u);
    EXPECT_EQ(ack.events[0].observation.kind, ObservationKind::SYNC);

    // Két tagból kettő látta: C bekerül.
    ASSERT_FALSE(groups.empty());
    EXPECT_EQ(groups.back(), (std::vector<NodeId>{A, B, C}));
}

TEST_F(GossipBusTest, TickSendsHeartbeatAndTargetedSync) {
    bus.tick();

    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(decodeMessage(sent[0].payload).kind, MessageKind::HEARTBEAT);
    EXPECT_FALSE(sent[0].target.has_value());

    EXPECT_EQ(decodeMessage(sent[1].payload).kind, MessageKind::BATCH);
    ASSERT_TRUE(sent[1].target.has_value());
    EXPECT_EQ(*sent[1].target, B);

    // A szinkron ritkább, mint a tick.
    sent.clear();
    bus.tick();
    for (const auto& m : sent) {
        EXPECT_NE(decodeMessage(m.payload).kind, MessageKind::BATCH);
    }
}

TEST_F(GossipBusTest, SendResultsDriveBusState) {
    EXPECT_EQ(bus.getTelemetrySnapshot().state, BusState::UP);
    bus.recordSend(false);
    EXPECT_EQ(bus.getTelemetrySnapshot().state, BusState::DEGRADED);
    EXPECT_EQ(bus.getTelemetrySnapshot().send_failures, 1u);
    bus.recordSend(true);
    EXPECT_EQ(bus.getTelemetrySnapshot().state, BusState::UP);
    bus.markStopped();
    bus.recordSend(true);
    EXPECT_EQ(bus.getTelemetrySnapshot().state, BusState::STOPPED);
}
