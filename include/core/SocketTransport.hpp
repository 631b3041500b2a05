// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework - SocketTransport (TCP frames)

#ifndef GOSSAMER_SOCKET_TRANSPORT_HPP
#define GOSSAMER_SOCKET_TRANSPORT_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

#include "core/GossipBus.hpp"
#include "core/PeerDirectory.hpp"
#include "utils/LogLevel.hpp"

namespace Gossamer::Core {

    class Scheduler;

    /**
     * @brief TCP transport: bejövő frame-ek a buszra, kimenő üzenetek a peerekhez.
     *
     * Frame: u32 big-endian hossz + payload. Küldésenként új kapcsolat.
     */
    class SocketTransport {
    private:
        GossipBus& bus;
        PeerDirectory directory;
        int serverFd;
        uint16_t port;
        size_t maxFrameBytes;
        std::atomic<bool> keepRunning;
        std::thread workerThread;

        GossamerUtils::LogLevel currentLogLevel;

        void listenLoop();
        void deliver(const OutboundMessage& message);

    public:
        SocketTransport(GossipBus& gBus,
                        PeerDirectory directory,
                        uint16_t listenPort,
                        size_t maxFrameBytes,
                        GossamerUtils::LogLevel level = GossamerUtils::LogLevel::INFO);
        ~SocketTransport();

        SocketTransport(const SocketTransport&) = delete;
        SocketTransport& operator=(const SocketTransport&) = delete;

        bool start();
        void stop(); // Clean shutdown

        // Feliratkozás a busz kimenő streamjére a vent scheduleren
        void attach(Scheduler& scheduler);

        bool sendTo(const GossamerUtils::PeerAddress& address, const std::string& payload);

        void setLogLevel(GossamerUtils::LogLevel level) { currentLogLevel = level; }
    };
}

#endif
