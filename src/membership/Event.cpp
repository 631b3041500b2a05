// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "membership/Event.hpp"

#include <sstream>
#include <tuple>

namespace Gossamer::Membership {

    const char* toString(ObservationKind kind) {
        switch (kind) {
            case ObservationKind::GENESIS: return "GENESIS";
            case ObservationKind::ADD:     return "ADD";
            case ObservationKind::REMOVE:  return "REMOVE";
            case ObservationKind::SYNC:    return "SYNC";
        }
        return "UNKNOWN";
    }

    Observation Observation::makeGenesis(std::set<NodeId> group) {
        Observation obs;
        obs.kind = ObservationKind::GENESIS;
        obs.genesis = std::move(group);
        return obs;
    }

    Observation Observation::makeAdd(const NodeId& node) {
        Observation obs;
        obs.kind = ObservationKind::ADD;
        obs.subject = node;
        return obs;
    }

    Observation Observation::makeRemove(const NodeId& node) {
        Observation obs;
        obs.kind = ObservationKind::REMOVE;
        obs.subject = node;
        return obs;
    }

    Observation Observation::makeSync() {
        return Observation{};
    }

    bool Observation::operator==(const Observation& other) const {
        return kind == other.kind && subject == other.subject && genesis == other.genesis;
    }

    bool Observation::operator<(const Observation& other) const {
        return std::tie(kind, subject, genesis) <
               std::tie(other.kind, other.subject, other.genesis);
    }

    std::string Observation::describe() const {
        std::ostringstream os;
        os << toString(kind);
        if (subject) {
            os << "(" << *subject << ")";
        } else if (kind == ObservationKind::GENESIS) {
            os << "{";
            bool first = true;
            for (const auto& node : genesis) {
                os << (first ? "" : ",") << node;
                first = false;
            }
            os << "}";
        }
        return os.str();
    }

} // namespace Gossamer::Membership
