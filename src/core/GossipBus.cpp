// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "core/GossipBus.hpp"
#include "core/NullScheduler.hpp"
#include "core/Scheduler.hpp"
#include "membership/WireCodec.hpp"
#include <iostream>
#include <iterator>
#include <set>

namespace Gossamer::Core {

    using GossamerUtils::LogLevel;
    using Membership::Message;
    using Membership::NodeId;

    GossipBus::GossipBus(Membership::NodeMembership& membership,
                         std::vector<NodeId> knownPeers,
                         std::chrono::milliseconds syncInterval,
                         LogLevel logLevel)
        : membership(membership),
          knownPeers(std::move(knownPeers)),
          syncInterval(syncInterval),
          lastSync(std::chrono::steady_clock::now() - syncInterval),
          logLevel(logLevel) {
        telemetry.reset_window();
    }

    void GossipBus::pushFrame(const std::string& source, const std::string& payload) {
        telemetry.frame_enqueued();
        inbound_bus.get_subscriber().on_next(InboundFrame{source, payload});
    }

    void GossipBus::startReactive(rxcpp::composite_subscription& lifetime, const Scheduler& scheduler) {
        // Minden állapotgép-hozzáférés a cortex workerre kerül.
        inbound_bus.get_observable()
            .observe_on(rxcpp::observe_on_one_worker(scheduler.getCortexScheduler()))
            .subscribe(lifetime, [this](const InboundFrame& frame) { processFrame(frame); });

        // Első csoport-kép a feliratkozóknak.
        rxcpp::observable<>::just(0)
            .observe_on(rxcpp::observe_on_one_worker(scheduler.getCortexScheduler()))
            .subscribe(lifetime, [this](int) { afterStateChange(); });

        if (logLevel != LogLevel::SILENT) {
            std::cout << "[GossipBus] Membership pipeline active for " << membership.id() << "." << std::endl;
        }
    }

    void GossipBus::processFrame(const InboundFrame& frame) {
        Message message = Message::makeHeartbeat(membership.id());
        try {
            message = Membership::decodeMessage(frame.payload);
        } catch (const Membership::CodecError& e) {
            NullScheduler::absorb(frame);
            telemetry.null_routed_frames++;
            telemetry.frame_done();
            if (logLevel == LogLevel::DEBUG) {
                std::cout << "[GossipBus] Null-routed frame from " << frame.source << ": " << e.what() << std::endl;
            }
            return;
        }

        try {
            std::vector<Message> replies = membership.handleMessage(message);
            telemetry.accepted_frames++;
            publish(replies);
        } catch (const Membership::MembershipError& e) {
            telemetry.rejected_messages++;
            std::cerr << "[GossipBus] Rejected message from " << message.sender
                      << " (" << frame.source << "): " << e.what() << std::endl;
        }

        telemetry.frame_done();
        afterStateChange();
    }

    void GossipBus::tick() {
        try {
            publish(membership.poll());
        } catch (const Membership::MembershipError& e) {
            std::cerr << "[ERROR] poll failed: " << e.what() << std::endl;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - lastSync >= syncInterval) {
            lastSync = now;
            if (auto target = nextSyncTarget()) {
                publish({membership.syncMessage()}, target);
            }
        }

        afterStateChange();
    }

    void GossipBus::publish(const std::vector<Message>& messages,
                            const std::optional<NodeId>& target) {
        for (const auto& message : messages) {
            try {
                outbound_bus.get_subscriber().on_next(
                    OutboundMessage{target, Membership::encodeMessage(message)});
            } catch (const Membership::CodecError& e) {
                std::cerr << "[ERROR] cannot encode outbound message: " << e.what() << std::endl;
            }
        }
    }

    std::optional<NodeId> GossipBus::nextSyncTarget() {
        std::set<NodeId> candidates(knownPeers.begin(), knownPeers.end());
        for (const auto& member : membership.group()) {
            candidates.insert(member);
        }
        candidates.erase(membership.id());
        if (candidates.empty()) return std::nullopt;

        auto it = candidates.begin();
        std::advance(it, static_cast<long>(syncCursor++ % candidates.size()));
        return *it;
    }

    void GossipBus::afterStateChange() {
        std::vector<NodeId> group = membership.group();
        telemetry.group_size.store(static_cast<uint32_t>(group.size()));
        telemetry.graph_events.store(membership.graph().size());
        telemetry.pending_events.store(membership.pendingCount());

        if (group != lastGroup) {
            lastGroup = group;
            group_bus.get_subscriber().on_next(group);
        }
    }

    void GossipBus::recordSend(bool ok) {
        if (ok) {
            telemetry.sent_messages++;
            BusState expected = BusState::DEGRADED;
            telemetry.state.compare_exchange_strong(expected, BusState::UP);
        } else {
            telemetry.send_failures++;
            BusState expected = BusState::UP;
            telemetry.state.compare_exchange_strong(expected, BusState::DEGRADED);
        }
    }

    TelemetrySnapshot GossipBus::getTelemetrySnapshot() const {
        return telemetry.snapshot();
    }

} // namespace Gossamer::Core
