// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "core/GossipBus.hpp"
#include "core/PeerDirectory.hpp"
#include "core/Scheduler.hpp"
#include "core/SocketTransport.hpp"
#include "membership/NodeMembership.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/NodeOptions.hpp"

using namespace Gossamer;

namespace {
    std::atomic<bool> g_running{true};

    void handle_signal(int) {
        g_running = false;
    }

    void print_telemetry(const Core::TelemetrySnapshot& snap) {
        std::cout << "[Telemetry] state=" << Core::toString(snap.state)
                  << " frames=" << snap.total
                  << " accepted=" << snap.accepted
                  << " null_routed=" << snap.null_routed
                  << " rejected=" << snap.rejected
                  << " sent=" << snap.sent
                  << " send_failures=" << snap.send_failures
                  << " queue_peak=" << snap.queue_peak
                  << " group=" << snap.group_size
                  << " events=" << snap.graph_events
                  << " pending=" << snap.pending_events << std::endl;
    }
}

int main(int argc, char* argv[]) {
    GossamerUtils::NodeOptions options;
    try {
        options = GossamerUtils::parseNodeOptions(argc, argv);
    } catch (const std::runtime_error& e) {
        std::cerr << "[ERROR] " << e.what() << "\n\n" << GossamerUtils::usage(argv[0]);
        return 2;
    }

    if (options.showHelp) {
        std::cout << GossamerUtils::usage(argv[0]);
        return 0;
    }
    if (options.printConfig) {
        for (const auto& line : GossamerTemplates::SAMPLE_CONFIG_CONTENT) {
            std::cout << line << "\n";
        }
        return 0;
    }

    std::cout << "--- GOSSAMER NODE " << options.id << " ---" << std::endl;

    std::set<Membership::NodeId> genesis;
    for (const auto& id : options.genesis) {
        genesis.insert(Membership::NodeId(id));
    }

    Membership::MembershipConfig config;
    config.failureTimeout = options.failureTimeout;
    config.heartbeatInterval = options.heartbeatInterval;
    config.maxPendingEvents = options.maxPendingEvents;

    std::unique_ptr<Membership::NodeMembership> membership;
    try {
        membership = std::make_unique<Membership::NodeMembership>(
            Membership::NodeId(options.id), genesis, config);
    } catch (const Membership::MembershipError& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    Core::PeerDirectory directory(options.peers);
    Core::GossipBus bus(*membership, directory.ids(), options.syncInterval, options.logLevel);
    Core::Scheduler scheduler;
    Core::SocketTransport transport(bus, directory, options.listenPort, options.maxFrameBytes, options.logLevel);

    if (!transport.start()) {
        std::cerr << "[ERROR] Transport could not start on port " << options.listenPort << std::endl;
        return 1;
    }

    if (options.logLevel != GossamerUtils::LogLevel::SILENT) {
        bus.groupChanges().subscribe(scheduler.getLifetime(), [](const std::vector<Membership::NodeId>& group) {
            std::cout << "[Node] Group (" << group.size() << "):";
            for (const auto& node : group) std::cout << " " << node;
            std::cout << std::endl;
        });
    }

    transport.attach(scheduler);
    scheduler.start(bus, options.tickInterval);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto lastReport = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (options.logLevel == GossamerUtils::LogLevel::DEBUG &&
            std::chrono::steady_clock::now() - lastReport >= std::chrono::seconds(10)) {
            print_telemetry(bus.getTelemetrySnapshot());
            lastReport = std::chrono::steady_clock::now();
        }
    }

    std::cout << "\n[Node] Shutting down." << std::endl;
    transport.stop();
    scheduler.stop();
    bus.markStopped();
    print_telemetry(bus.getTelemetrySnapshot());

    return 0;
}
