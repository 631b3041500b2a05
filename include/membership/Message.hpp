// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#ifndef GOSSAMER_MESSAGE_HPP
#define GOSSAMER_MESSAGE_HPP

#include <cstdint>
#include <vector>

#include "membership/Event.hpp"

namespace Gossamer::Membership {

    enum class MessageKind : uint8_t {
        EVENT     = 0, // Pontosan egy új esemény
        BATCH     = 1, // Anti-entropy: események topologikus sorrendben
        HEARTBEAT = 2
    };

    /**
     * @brief A hálózati rétegnek átadott / tőle kapott üzenet.
     */
    struct Message {
        MessageKind kind;
        NodeId sender;
        std::vector<Event> events;

        static Message makeEvent(const NodeId& sender, Event event) {
            return Message{MessageKind::EVENT, sender, {std::move(event)}};
        }

        static Message makeBatch(const NodeId& sender, std::vector<Event> events) {
            return Message{MessageKind::BATCH, sender, std::move(events)};
        }

        static Message makeHeartbeat(const NodeId& sender) {
            return Message{MessageKind::HEARTBEAT, sender, {}};
        }
    };

} // namespace Gossamer::Membership

#endif // GOSSAMER_MESSAGE_HPP
