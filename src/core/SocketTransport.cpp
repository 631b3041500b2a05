// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework - SocketTransport

#include "core/SocketTransport.hpp"
#include "core/Scheduler.hpp"
#include "core/TcpFraming.hpp"
#include <iostream>
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <thread>

namespace Gossamer::Core {

    using GossamerUtils::LogLevel;

    SocketTransport::SocketTransport(GossipBus& gBus,
                                     PeerDirectory directory,
                                     uint16_t listenPort,
                                     size_t maxFrameBytes,
                                     LogLevel level)
        : bus(gBus), directory(std::move(directory)), serverFd(-1), port(listenPort),
          maxFrameBytes(maxFrameBytes), keepRunning(false), currentLogLevel(level) {}

    SocketTransport::~SocketTransport() {
        stop();
    }

    bool SocketTransport::start() {
        if (keepRunning) return true;

        serverFd = socket(AF_INET, SOCK_STREAM, 0);
        if (serverFd < 0) {
            std::cerr << "[SocketTransport] socket() failed: " << std::strerror(errno) << std::endl;
            return false;
        }

        int opt = 1;
        setsockopt(serverFd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = INADDR_ANY;
        address.sin_port = htons(port);

        if (bind(serverFd, (struct sockaddr*)&address, sizeof(address)) < 0) {
            std::cerr << "[SocketTransport] bind(" << port << ") failed: " << std::strerror(errno) << std::endl;
            close(serverFd);
            serverFd = -1;
            return false;
        }

        if (listen(serverFd, 128) < 0) {
            std::cerr << "[SocketTransport] listen() failed: " << std::strerror(errno) << std::endl;
            close(serverFd);
            serverFd = -1;
            return false;
        }

        fcntl(serverFd, F_SETFL, O_NONBLOCK);

        keepRunning = true;
        workerThread = std::thread(&SocketTransport::listenLoop, this);

        if (currentLogLevel != LogLevel::SILENT) {
            std::cout << "[SocketTransport] Listening on port " << port
                      << ", " << directory.size() << " peer(s) known." << std::endl;
        }
        return true;
    }

    void SocketTransport::listenLoop() {
        struct timeval tcpTimeout{1, 0};

        while (keepRunning) {
            struct sockaddr_in clientAddr{};
            socklen_t addrLen = sizeof(clientAddr);

            int clientFd = accept(serverFd, (struct sockaddr*)&clientAddr, &addrLen);

            if (clientFd < 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }

            // BSD-n az accept-elt socket örökli az O_NONBLOCK-ot; blokkoló olvasás kell, timeouttal.
            int flags = fcntl(clientFd, F_GETFL, 0);
            if (flags >= 0) fcntl(clientFd, F_SETFL, flags & ~O_NONBLOCK);
            setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tcpTimeout, sizeof(tcpTimeout));

            char host[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &clientAddr.sin_addr, host, sizeof(host));
            std::string source = std::string(host) + ":" + std::to_string(ntohs(clientAddr.sin_port));

            std::string payload;
            auto deadline = std::chrono::steady_clock::now() + FRAME_READ_DEADLINE;
            if (readFrame(clientFd, maxFrameBytes, deadline, payload)) {
                bus.pushFrame(source, payload);
            } else if (currentLogLevel == LogLevel::DEBUG) {
                std::cout << "[SocketTransport] Incomplete, oversized or too slow frame from " << source << std::endl;
            }

            close(clientFd);
        }
    }

    bool SocketTransport::sendTo(const GossamerUtils::PeerAddress& peer, const std::string& payload) {
        if (payload.size() > maxFrameBytes) {
            std::cerr << "[SocketTransport] Outbound frame of " << payload.size()
                      << " bytes exceeds max_frame_bytes" << std::endl;
            return false;
        }

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) return false;

        struct timeval sendTimeout{1, 0};
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, (const char*)&sendTimeout, sizeof(sendTimeout));

        struct sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_port = htons(peer.port);
        if (inet_pton(AF_INET, peer.host.c_str(), &address.sin_addr) != 1) {
            close(fd);
            return false;
        }

        if (connect(fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
            close(fd);
            return false;
        }

        bool ok = writeFrame(fd, payload);
        close(fd);
        return ok;
    }

    void SocketTransport::deliver(const OutboundMessage& message) {
        if (message.target) {
            auto address = directory.find(*message.target);
            if (!address) {
                if (currentLogLevel == LogLevel::DEBUG) {
                    std::cout << "[SocketTransport] No address for " << *message.target << std::endl;
                }
                return;
            }
            bus.recordSend(sendTo(*address, message.payload));
            return;
        }

        for (const auto& id : directory.ids()) {
            auto address = directory.find(id);
            bool ok = sendTo(*address, message.payload);
            bus.recordSend(ok);
            if (!ok && currentLogLevel == LogLevel::DEBUG) {
                std::cout << "[SocketTransport] Send to " << id << " failed" << std::endl;
            }
        }
    }

    void SocketTransport::attach(Scheduler& scheduler) {
        bus.outbound()
            .observe_on(rxcpp::observe_on_one_worker(scheduler.getVentScheduler()))
            .subscribe(scheduler.getLifetime(), [this](const OutboundMessage& message) { deliver(message); });
    }

    void SocketTransport::stop() {
        if (!keepRunning) return;
        keepRunning = false;
        if (workerThread.joinable()) {
            workerThread.join();
        }
        if (serverFd >= 0) {
            close(serverFd);
            serverFd = -1;
        }
    }

} // namespace Gossamer::Core
