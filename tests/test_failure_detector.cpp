#include <gtest/gtest.h>

#include <memory>

#include "membership/FailureDetector.hpp"

using namespace Gossamer::Membership;
using namespace std::chrono_literals;

namespace {
    struct ManualClock {
        std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>();

        Clock clock() const {
            auto t = now;
            return [t] { return *t; };
        }
        void advance(std::chrono::milliseconds d) { *now += d; }
    };

    const NodeId B("b");
    const NodeId C("c");
}

TEST(InternalFailureDetector, RejectsNonPositiveTimeout) {
    EXPECT_THROW(InternalFailureDetector(0ms), FailureDetectorError);
    EXPECT_THROW(InternalFailureDetector(-5ms), FailureDetectorError);
}

TEST(InternalFailureDetector, NothingFailsBeforeTimeout) {
    ManualClock mc;
    InternalFailureDetector fd(1000ms, mc.clock());
    fd.monitor({B, C});

    mc.advance(1000ms);
    fd.pollFailures();
    EXPECT_TRUE(fd.dequeueFailures().empty());
}

TEST(InternalFailureDetector, SilentNodeIsReportedOnce) {
    ManualClock mc;
    InternalFailureDetector fd(1000ms, mc.clock());
    fd.monitor({B, C});

    mc.advance(600ms);
    fd.recordHeartbeat(C);
    mc.advance(600ms);
    fd.pollFailures();

    EXPECT_EQ(fd.dequeueFailures(), std::vector<NodeId>{B});
    EXPECT_TRUE(fd.isSuspected(B));
    EXPECT_FALSE(fd.isSuspected(C));

    // Ugyanaz a hiba nem jön újra.
    mc.advance(5000ms);
    fd.pollFailures();
    std::vector<NodeId> again = fd.dequeueFailures();
    EXPECT_EQ(again, std::vector<NodeId>{C});
}

TEST(InternalFailureDetector, DequeueDrainsTheQueue) {
    ManualClock mc;
    InternalFailureDetector fd(100ms, mc.clock());
    fd.monitor({B});
    mc.advance(200ms);
    fd.pollFailures();

    EXPECT_EQ(fd.dequeueFailures().size(), 1u);
    EXPECT_TRUE(fd.dequeueFailures().empty());
}

TEST(InternalFailureDetector, HeartbeatRearmsSuspectedNode) {
    ManualClock mc;
    InternalFailureDetector fd(100ms, mc.clock());
    fd.monitor({B});

    mc.advance(200ms);
    fd.pollFailures();
    ASSERT_EQ(fd.dequeueFailures().size(), 1u);

    fd.recordHeartbeat(B);
    EXPECT_FALSE(fd.isSuspected(B));

    mc.advance(200ms);
    fd.pollFailures();
    EXPECT_EQ(fd.dequeueFailures(), std::vector<NodeId>{B});
}

TEST(InternalFailureDetector, MonitorForgetsRemovedAndStartsNewNodesFresh) {
    ManualClock mc;
    InternalFailureDetector fd(100ms, mc.clock());
    fd.monitor({B});
    EXPECT_EQ(fd.watchedCount(), 1u);

    mc.advance(90ms);
    fd.monitor({C});
    EXPECT_EQ(fd.watchedCount(), 1u);

    // B-t már nem figyeljük, a heartbeat figyelmen kívül marad.
    fd.recordHeartbeat(B);
    EXPECT_EQ(fd.watchedCount(), 1u);

    mc.advance(50ms);
    fd.pollFailures();
    EXPECT_TRUE(fd.dequeueFailures().empty());

    mc.advance(60ms);
    fd.pollFailures();
    EXPECT_EQ(fd.dequeueFailures(), std::vector<NodeId>{C});
}

TEST(InternalFailureDetector, MonitorKeepsLastSeenOfExistingNodes) {
    ManualClock mc;
    InternalFailureDetector fd(100ms, mc.clock());
    fd.monitor({B});

    mc.advance(80ms);
    fd.monitor({B, C});
    mc.advance(30ms);
    fd.pollFailures();

    EXPECT_EQ(fd.dequeueFailures(), std::vector<NodeId>{B});
}
