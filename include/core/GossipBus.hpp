// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#ifndef GOSSIP_BUS_HPP
#define GOSSIP_BUS_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "rxcpp/rx.hpp"

#include "membership/NodeMembership.hpp"
#include "telemetry/BusTelemetry.hpp"
#include "utils/LogLevel.hpp"

namespace Gossamer::Core {

    class Scheduler;

    /**
     * @brief Nyers frame a hálózatról (még nem dekódolt).
     */
    struct InboundFrame {
        std::string source;
        std::string payload;
    };

    /**
     * @brief Kódolt üzenet a hálózati rétegnek.
     * target == nullopt: minden ismert peernek.
     */
    struct OutboundMessage {
        std::optional<Membership::NodeId> target;
        std::string payload;
    };

    /**
     * @brief Gossip Bus Controller
     * Facade: elrejti a belső Rx subjecteket és a NodeMembership állapotgépet.
     * A processFrame() és a tick() csak a scheduler cortex workerén futhat.
     */
    class GossipBus {
    private:
        // 1. Inbound (hálózatról jövő nyers frame-ek)
        rxcpp::subjects::subject<InboundFrame> inbound_bus;

        // 2. Outbound (kódolt üzenetek a transportnak)
        rxcpp::subjects::subject<OutboundMessage> outbound_bus;

        // 3. Csoport-változások
        rxcpp::subjects::subject<std::vector<Membership::NodeId>> group_bus;

        Membership::NodeMembership& membership;
        std::vector<Membership::NodeId> knownPeers;

        // Anti-entropy
        std::chrono::milliseconds syncInterval;
        std::chrono::steady_clock::time_point lastSync;
        size_t syncCursor = 0;

        std::vector<Membership::NodeId> lastGroup;
        GossamerUtils::LogLevel logLevel;

        // --- Telemetry ---
        BusTelemetry telemetry;

        void publish(const std::vector<Membership::Message>& messages,
                     const std::optional<Membership::NodeId>& target = std::nullopt);
        void afterStateChange();
        std::optional<Membership::NodeId> nextSyncTarget();

    public:
        GossipBus(Membership::NodeMembership& membership,
                  std::vector<Membership::NodeId> knownPeers,
                  std::chrono::milliseconds syncInterval,
                  GossamerUtils::LogLevel logLevel = GossamerUtils::LogLevel::INFO);

        // --- Public API (Publishing) ---

        // Nyers frame betolása (a SocketTransport hívja)
        void pushFrame(const std::string& source, const std::string& payload);

        // --- Lifecycle Management ---

        // A Scheduler hívja meg, hogy felépítse a reaktív láncot
        void startReactive(rxcpp::composite_subscription& lifetime, const Scheduler& scheduler);

        // --- Cortex worker ---
        void processFrame(const InboundFrame& frame);
        void tick();

        // --- Streams ---
        rxcpp::observable<OutboundMessage> outbound() const { return outbound_bus.get_observable(); }
        rxcpp::observable<std::vector<Membership::NodeId>> groupChanges() const { return group_bus.get_observable(); }

        // A transport jelzi vissza a küldés eredményét
        void recordSend(bool ok);
        void markStopped() { telemetry.state.store(BusState::STOPPED); }

        // --- Diagnostics ---
        [[nodiscard]] TelemetrySnapshot getTelemetrySnapshot() const;
    };
}

#endif
