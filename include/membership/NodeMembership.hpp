// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework
// Replicated node membership state machine

#ifndef GOSSAMER_NODE_MEMBERSHIP_HPP
#define GOSSAMER_NODE_MEMBERSHIP_HPP

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "membership/FailureDetector.hpp"
#include "membership/Graph.hpp"
#include "membership/MembershipConfig.hpp"
#include "membership/Message.hpp"

namespace Gossamer::Membership {

    class MembershipError : public std::runtime_error {
    public:
        enum class Kind {
            FAILURE_DETECTOR,
            GRAPH,
            INVALID_GENESIS,
            GENESIS_MISMATCH,
            PENDING_OVERFLOW,
            ALREADY_MEMBER,
            NOT_MEMBER
        };

        MembershipError(Kind kind, const std::string& what)
            : std::runtime_error(what), errorKind(kind) {}

        Kind kind() const { return errorKind; }

    private:
        Kind errorKind;
    };

    /**
     * @brief A node-csoport tagságának replikált állapotgépe.
     *
     * Kapcsolat a külső hálózati réteggel:
     *  - poll(): a lokális hiba-detektor lekérdezése, kimenő gossip üzenetek;
     *  - handleMessage(): egy távoli node-tól érkezett üzenet feldolgozása.
     *
     * Nem szálbiztos: minden hívásnak ugyanarról a workerről kell jönnie.
     */
    class NodeMembership {
    public:
        NodeMembership(NodeId ourId,
                       std::set<NodeId> genesisGroup,
                       MembershipConfig config = MembershipConfig(),
                       std::unique_ptr<FailureDetector> detector = nullptr);

        const NodeId& id() const { return ourId; }
        const Graph& graph() const { return gossipGraph; }

        /**
         * @brief Hiba-detektor lekérdezése; Remove javaslatok és heartbeat kiküldése.
         * @throws MembershipError (FAILURE_DETECTOR, GRAPH)
         */
        std::vector<Message> poll();

        /**
         * @brief Bejövő üzenet kezelése. A visszaadott üzeneteket minden tagnak ki kell küldeni.
         * @throws MembershipError (GENESIS_MISMATCH, PENDING_OVERFLOW, GRAPH)
         */
        std::vector<Message> handleMessage(const Message& message);

        std::vector<Message> requestAdd(const NodeId& node);
        std::vector<Message> requestRemove(const NodeId& node);

        // A jelenleg elfogadott csoport, rendezve.
        std::vector<NodeId> group() const;
        bool isMember(const NodeId& node) const { return currentGroup.count(node) > 0; }

        // A teljes gráf egy BATCH üzenetben, topologikus sorrendben.
        Message syncMessage() const;

        size_t pendingCount() const { return pending.size(); }

    private:
        NodeId ourId;
        std::set<NodeId> genesis;
        MembershipConfig config;

        // A node lokális gossip gráfja
        Graph gossipGraph;
        // Hiba-detektor alrendszer
        std::unique_ptr<FailureDetector> failureDetector;

        std::set<NodeId> currentGroup;

        // Szülőre váró események, hash szerint.
        std::map<Hash, Event> pending;

        std::optional<TimePoint> lastHeartbeat;

        Message createEvent(const Observation& observation, const std::optional<Hash>& otherParent);
        void ingest(const Event& event, std::vector<Message>& out);
        void insertAndReact(const Event& event, std::vector<Message>& out);
        void drainPending(std::vector<Message>& out);
        void purgePending(const NodeId& creator);

        std::set<Observation> observationsSeenBy(const EventRef& event) const;
        bool ourChainHasSeen(const Observation& observation) const;

        void recomputeGroup();
    };

} // namespace Gossamer::Membership

#endif // GOSSAMER_NODE_MEMBERSHIP_HPP
