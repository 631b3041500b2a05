// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "membership/NodeMembership.hpp"
#include "membership/WireCodec.hpp"

#include <iostream>
#include <sstream>

namespace Gossamer::Membership {

    namespace {
        // A hiba-detektor a saját node-ot nem figyeli.
        std::set<NodeId> peersOf(const std::set<NodeId>& group, const NodeId& self) {
            std::set<NodeId> peers = group;
            peers.erase(self);
            return peers;
        }

        std::string formatGroup(const std::set<NodeId>& group) {
            std::ostringstream os;
            os << "{";
            bool first = true;
            for (const auto& node : group) {
                os << (first ? "" : ",") << node;
                first = false;
            }
            os << "}";
            return os.str();
        }
    }

    NodeMembership::NodeMembership(NodeId ourId,
                                   std::set<NodeId> genesisGroup,
                                   MembershipConfig config,
                                   std::unique_ptr<FailureDetector> detector)
        : ourId(std::move(ourId)),
          genesis(std::move(genesisGroup)),
          config(std::move(config)),
          failureDetector(std::move(detector)) {

        if (genesis.empty()) {
            throw MembershipError(MembershipError::Kind::INVALID_GENESIS,
                                  "genesis group must not be empty");
        }

        if (!failureDetector) {
            try {
                failureDetector = std::make_unique<InternalFailureDetector>(
                    this->config.failureTimeout, this->config.clock);
            } catch (const FailureDetectorError& e) {
                throw MembershipError(MembershipError::Kind::FAILURE_DETECTOR, e.what());
            }
        }

        try {
            gossipGraph.insert(Event{this->ourId, std::nullopt, std::nullopt,
                                     Observation::makeGenesis(genesis)});
        } catch (const GraphError& e) {
            throw MembershipError(MembershipError::Kind::GRAPH, e.what());
        }

        currentGroup = genesis;
        failureDetector->monitor(peersOf(currentGroup, this->ourId));
    }

    // --- Public API ---

    std::vector<Message> NodeMembership::poll() {
        try {
            failureDetector->pollFailures();
        } catch (const FailureDetectorError& e) {
            throw MembershipError(MembershipError::Kind::FAILURE_DETECTOR, e.what());
        }

        std::vector<Message> out;
        for (const auto& node : failureDetector->dequeueFailures()) {
            if (node == ourId || !isMember(node)) continue;

            Observation removal = Observation::makeRemove(node);
            if (ourChainHasSeen(removal)) continue;

            std::cout << "[NodeMembership] " << ourId << ": " << node
                      << " silent for too long, proposing removal" << std::endl;
            out.push_back(createEvent(removal, std::nullopt));
        }
        if (!out.empty()) {
            recomputeGroup();
        }

        const TimePoint now = config.clock();
        if (!lastHeartbeat || now - *lastHeartbeat >= config.heartbeatInterval) {
            out.push_back(Message::makeHeartbeat(ourId));
            lastHeartbeat = now;
        }
        return out;
    }

    std::vector<Message> NodeMembership::handleMessage(const Message& message) {
        // Bármilyen üzenet életjel a küldőtől.
        if (message.sender != ourId) {
            failureDetector->recordHeartbeat(message.sender);
        }

        std::vector<Message> out;
        if (message.kind == MessageKind::HEARTBEAT) {
            return out;
        }

        for (const auto& event : message.events) {
            ingest(event, out);
        }
        return out;
    }

    std::vector<Message> NodeMembership::requestAdd(const NodeId& node) {
        if (isMember(node)) {
            throw MembershipError(MembershipError::Kind::ALREADY_MEMBER,
                                  node.str() + " is already a member");
        }

        Observation addition = Observation::makeAdd(node);
        if (ourChainHasSeen(addition)) {
            return {};
        }

        std::vector<Message> out{createEvent(addition, std::nullopt)};
        recomputeGroup();
        return out;
    }

    std::vector<Message> NodeMembership::requestRemove(const NodeId& node) {
        if (!isMember(node)) {
            throw MembershipError(MembershipError::Kind::NOT_MEMBER,
                                  node.str() + " is not a member");
        }

        Observation removal = Observation::makeRemove(node);
        if (ourChainHasSeen(removal)) {
            return {};
        }

        std::vector<Message> out{createEvent(removal, std::nullopt)};
        recomputeGroup();
        return out;
    }

    std::vector<NodeId> NodeMembership::group() const {
        return std::vector<NodeId>(currentGroup.begin(), currentGroup.end());
    }

    Message NodeMembership::syncMessage() const {
        std::vector<Event> events;
        events.reserve(gossipGraph.size());
        for (size_t i = 0; i < gossipGraph.size(); ++i) {
            events.push_back(*gossipGraph.getByIndex(i)->event);
        }
        return Message::makeBatch(ourId, std::move(events));
    }

    // --- Internals ---

    Message NodeMembership::createEvent(const Observation& observation,
                                        const std::optional<Hash>& otherParent) {
        // A genesis esemény miatt mindig van saját eseményünk.
        auto latest = gossipGraph.latestBy(ourId);
        Event event{ourId, gossipGraph.hashAt(latest->index), otherParent, observation};

        try {
            gossipGraph.insert(event);
        } catch (const GraphError& e) {
            throw MembershipError(MembershipError::Kind::GRAPH, e.what());
        }
        return Message::makeEvent(ourId, std::move(event));
    }

    void NodeMembership::ingest(const Event& event, std::vector<Message>& out) {
        Hash hash;
        try {
            hash = hashEvent(event);
        } catch (const std::runtime_error& e) {
            throw MembershipError(MembershipError::Kind::GRAPH, e.what());
        }

        if (gossipGraph.contains(hash) || pending.count(hash)) {
            return;
        }

        if (event.observation.kind == ObservationKind::GENESIS &&
            event.observation.genesis != genesis) {
            purgePending(event.creator);
            throw MembershipError(MembershipError::Kind::GENESIS_MISMATCH,
                                  event.creator.str() + " announced genesis " +
                                  event.observation.describe() + ", ours is " + formatGroup(genesis));
        }

        if (!gossipGraph.parentsPresent(event)) {
            if (pending.size() >= config.maxPendingEvents) {
                throw MembershipError(MembershipError::Kind::PENDING_OVERFLOW,
                                      "more than " + std::to_string(config.maxPendingEvents) +
                                      " events waiting for parents");
            }
            pending.emplace(hash, event);
            return;
        }

        insertAndReact(event, out);
        drainPending(out);
    }

    void NodeMembership::insertAndReact(const Event& event, std::vector<Message>& out) {
        size_t index = 0;
        try {
            index = gossipGraph.insert(event).index;
        } catch (const GraphError& e) {
            throw MembershipError(MembershipError::Kind::GRAPH, e.what());
        }

        // Nyugtázzuk a más által javasolt változást, ha még nem láttuk.
        const Observation& observation = event.observation;
        if (observation.changesMembership() && event.creator != ourId &&
            !ourChainHasSeen(observation)) {
            out.push_back(createEvent(Observation::makeSync(), gossipGraph.hashAt(index)));
        }

        recomputeGroup();
    }

    void NodeMembership::drainPending(std::vector<Message>& out) {
        bool progress = true;
        while (progress && !pending.empty()) {
            progress = false;
            for (auto it = pending.begin(); it != pending.end();) {
                if (!gossipGraph.parentsPresent(it->second)) {
                    ++it;
                    continue;
                }
                Event ready = std::move(it->second);
                it = pending.erase(it);
                insertAndReact(ready, out);
                progress = true;
            }
        }
    }

    /**
     * @brief Egy elutasított lánc parkoló eseményeinek eldobása.
     *
     * A creator összes várakozó eseménye kiesik, majd minden olyan is, amelyik
     * egy kiesett eseményre hivatkozik. Ezek szülői már sosem érkeznek meg.
     */
    void NodeMembership::purgePending(const NodeId& creator) {
        std::set<Hash> dropped;
        bool progress = true;
        while (progress) {
            progress = false;
            for (auto it = pending.begin(); it != pending.end();) {
                const Event& parked = it->second;
                const bool orphaned =
                    parked.creator == creator ||
                    (parked.selfParent && dropped.count(*parked.selfParent)) ||
                    (parked.otherParent && dropped.count(*parked.otherParent));
                if (!orphaned) {
                    ++it;
                    continue;
                }
                dropped.insert(it->first);
                it = pending.erase(it);
                progress = true;
            }
        }

        if (!dropped.empty()) {
            std::cout << "[NodeMembership] " << ourId << ": dropped " << dropped.size()
                      << " pending event(s) rooted at " << creator << std::endl;
        }
    }

    std::set<Observation> NodeMembership::observationsSeenBy(const EventRef& event) const {
        std::set<Observation> seen;
        SubGraphIter it = gossipGraph.ancestors(event);
        while (auto ref = it.next()) {
            if (ref->event->observation.changesMembership()) {
                seen.insert(ref->event->observation);
            }
        }
        return seen;
    }

    bool NodeMembership::ourChainHasSeen(const Observation& observation) const {
        auto latest = gossipGraph.latestBy(ourId);
        if (!latest) return false;
        return observationsSeenBy(*latest).count(observation) > 0;
    }

    /**
     * The decision depends only on the event set, not on insertion order:
     * observations are applied in their own total order, one at a time, each once
     * seen by more than two thirds of the members of the group at that point.
     */
    void NodeMembership::recomputeGroup() {
        std::map<NodeId, std::set<Observation>> seenBy;
        std::set<Observation> candidates;
        for (const auto& creator : gossipGraph.creators()) {
            auto latest = gossipGraph.latestBy(creator);
            std::set<Observation> seen = observationsSeenBy(*latest);
            candidates.insert(seen.begin(), seen.end());
            seenBy.emplace(creator, std::move(seen));
        }

        std::set<NodeId> group = genesis;
        std::set<Observation> applied;

        bool progress = true;
        while (progress) {
            progress = false;
            for (const auto& observation : candidates) {
                if (applied.count(observation)) continue;

                const NodeId& subject = *observation.subject;
                const bool isAdd = observation.kind == ObservationKind::ADD;
                if (isAdd == (group.count(subject) > 0)) continue;

                size_t votes = 0;
                for (const auto& member : group) {
                    auto it = seenBy.find(member);
                    if (it != seenBy.end() && it->second.count(observation)) {
                        ++votes;
                    }
                }

                if (votes * 3 > group.size() * 2) {
                    if (isAdd) group.insert(subject);
                    else group.erase(subject);
                    applied.insert(observation);
                    progress = true;
                    break;
                }
            }
        }

        if (group != currentGroup) {
            std::cout << "[NodeMembership] " << ourId << ": group " << formatGroup(currentGroup)
                      << " -> " << formatGroup(group) << std::endl;
            currentGroup = std::move(group);
            failureDetector->monitor(peersOf(currentGroup, ourId));
        }
    }

} // namespace Gossamer::Membership
