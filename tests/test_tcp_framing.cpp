#include <gtest/gtest.h>

#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <string>
#include <thread>

#include "core/TcpFraming.hpp"

using namespace Gossamer::Core;
using namespace std::chrono_literals;

namespace {
    class TcpFramingTest : public ::testing::Test {
    protected:
        int fds[2] = {-1, -1};

        void SetUp() override {
            ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        }

        void TearDown() override {
            closeEnd(0);
            closeEnd(1);
        }

        void closeEnd(int i) {
            if (fds[i] >= 0) {
                close(fds[i]);
                fds[i] = -1;
            }
        }

        static FrameDeadline in(std::chrono::milliseconds d) {
            return std::chrono::steady_clock::now() + d;
        }
    };
}

TEST_F(TcpFramingTest, FrameRoundTrip) {
    std::string payload("\x01\x00membership", 12);
    ASSERT_TRUE(writeFrame(fds[0], payload));

    std::string received;
    ASSERT_TRUE(readFrame(fds[1], 1024, in(1000ms), received));
    EXPECT_EQ(received, payload);
}

TEST_F(TcpFramingTest, EmptyFrameIsValid) {
    ASSERT_TRUE(writeFrame(fds[0], ""));
    std::string received = "stale";
    ASSERT_TRUE(readFrame(fds[1], 1024, in(1000ms), received));
    EXPECT_TRUE(received.empty());
}

TEST_F(TcpFramingTest, OversizedFrameIsRefused) {
    ASSERT_TRUE(writeFrame(fds[0], std::string(100, 'x')));
    std::string received;
    EXPECT_FALSE(readFrame(fds[1], 99, in(1000ms), received));
}

TEST_F(TcpFramingTest, ClosedConnectionMidFrameFails) {
    const unsigned char header[FRAME_HEADER_BYTES] = {0, 0, 0, 10};
    ASSERT_TRUE(writeAll(fds[0], reinterpret_cast<const char*>(header), sizeof(header)));
    ASSERT_TRUE(writeAll(fds[0], "abc", 3));
    closeEnd(0);

    std::string received;
    EXPECT_FALSE(readFrame(fds[1], 1024, in(1000ms), received));
}

TEST_F(TcpFramingTest, TrickledFrameHitsDeadline) {
    // Bájtonként csöpögő küldő: egyik read() sem vár sokat, de a frame sosem ér véget időben.
    std::thread sender([fd = fds[0]] {
        const unsigned char header[FRAME_HEADER_BYTES] = {0, 0, 0, 200};
        if (!writeAll(fd, reinterpret_cast<const char*>(header), sizeof(header))) return;
        for (int i = 0; i < 200; ++i) {
            if (!writeAll(fd, "x", 1)) return;
            std::this_thread::sleep_for(20ms);
        }
    });

    auto started = std::chrono::steady_clock::now();
    std::string received;
    bool ok = readFrame(fds[1], 1024, in(200ms), received);
    auto elapsed = std::chrono::steady_clock::now() - started;

    // A küldő a következő írásnál hibát kap és kilép.
    closeEnd(1);
    sender.join();

    EXPECT_FALSE(ok);
    EXPECT_LT(elapsed, 1500ms);
}
