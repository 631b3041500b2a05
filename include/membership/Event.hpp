// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework
// Gossip events: the vertices of the gossip graph

#ifndef GOSSAMER_EVENT_HPP
#define GOSSAMER_EVENT_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "membership/Hash.hpp"
#include "membership/NodeId.hpp"

namespace Gossamer::Membership {

    /**
     * @brief Hálózati események megfigyeléseinek típusa.
     * A numerikus érték a wire formátum része.
     */
    enum class ObservationKind : uint8_t {
        GENESIS = 0, // A kezdő csoport
        ADD     = 1,
        REMOVE  = 2,
        SYNC    = 3  // Nincs tagság-változás, csak "láttam az other parentet"
    };

    const char* toString(ObservationKind kind);

    // Csak a kindhoz tartozó mező lehet kitöltve; a kódoló a többit elutasítja,
    // így két különböző, gráfba kerülő megfigyelés kódolása sem eshet egybe.
    struct Observation {
        ObservationKind kind = ObservationKind::SYNC;

        // GENESIS esetén a kezdő csoport
        std::set<NodeId> genesis;

        // ADD / REMOVE esetén az érintett node
        std::optional<NodeId> subject;

        static Observation makeGenesis(std::set<NodeId> group);
        static Observation makeAdd(const NodeId& node);
        static Observation makeRemove(const NodeId& node);
        static Observation makeSync();

        bool changesMembership() const {
            return kind == ObservationKind::ADD || kind == ObservationKind::REMOVE;
        }

        bool operator==(const Observation& other) const;
        bool operator!=(const Observation& other) const { return !(*this == other); }

        // Determinisztikus sorrend a döntések alkalmazásához.
        bool operator<(const Observation& other) const;

        std::string describe() const;
    };

    /**
     * @brief Egy gossip esemény.
     */
    struct Event {
        NodeId creator;
        std::optional<Hash> selfParent;
        std::optional<Hash> otherParent;
        Observation observation;

        bool operator==(const Event& other) const {
            return creator == other.creator &&
                   selfParent == other.selfParent &&
                   otherParent == other.otherParent &&
                   observation == other.observation;
        }
        bool operator!=(const Event& other) const { return !(*this == other); }
    };

    /**
     * @brief Hivatkozás egy eseményre és annak indexére a gráfban.
     * Csak az index alapján hasonlítunk.
     */
    struct EventRef {
        const Event* event;
        size_t index;

        bool operator==(const EventRef& other) const { return index == other.index; }
        bool operator!=(const EventRef& other) const { return index != other.index; }
        bool operator<(const EventRef& other) const { return index < other.index; }
    };

} // namespace Gossamer::Membership

#endif // GOSSAMER_EVENT_HPP
