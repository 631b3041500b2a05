// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework
// Gossip graph: hashed events linked by self-parent and other-parent

#ifndef GOSSAMER_GRAPH_HPP
#define GOSSAMER_GRAPH_HPP

#include <deque>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "membership/Event.hpp"
#include "membership/Hash.hpp"

namespace Gossamer::Membership {

    /**
     * @brief Gossip gráf hiba.
     */
    class GraphError : public std::runtime_error {
    public:
        enum class Kind {
            UNKNOWN_PARENT,
            INVALID_SELF_PARENT,
            INVALID_EVENT,
            HASH_COLLISION,
            HASH
        };

        GraphError(Kind kind, const std::string& what)
            : std::runtime_error("Gossip graph error: " + what), errorKind(kind) {}

        Kind kind() const { return errorKind; }

    private:
        Kind errorKind;
    };

    class Graph;

    /**
     * @brief Egy esemény és összes őse, mindegyik egyszer, csökkenő index szerint.
     * A frontier a még be nem járt indexek halmaza, a seen bitset véd a duplikátumoktól.
     */
    class SubGraphIter {
    public:
        SubGraphIter(const Graph& graph, size_t start);

        std::optional<EventRef> next();

        // Az összes hátralévő elem.
        std::vector<EventRef> collect();

    private:
        const Graph& graph;
        std::set<size_t> nodes;
        std::vector<bool> seen;

        void enqueue(size_t index);
    };

    /**
     * @brief A node lokális gossip gráfja.
     *
     * A beszúrási sorrend topologikus: egy esemény csak akkor kerül be, ha
     * mindkét szülője már jelen van. Az EventRef-ek a beszúrások után is érvényesek.
     */
    class Graph {
    public:
        Graph() = default;

        std::optional<size_t> getIndex(const Hash& hash) const;
        bool contains(const Hash& hash) const;

        /**
         * @brief Új esemény beszúrása. Ha már benne van, a meglévőre mutat.
         * @throws GraphError ha hiányzik egy szülő, vagy az esemény szerkezetileg hibás.
         */
        EventRef insert(const Event& event);

        std::optional<EventRef> getByIndex(size_t index) const;
        std::optional<EventRef> getByHash(const Hash& hash) const;
        const Hash& hashAt(size_t index) const { return hashes.at(index); }

        bool parentsPresent(const Event& event) const;

        // A creator legnagyobb indexű eseménye.
        std::optional<EventRef> latestBy(const NodeId& creator) const;

        // Minden node, akinek van eseménye a gráfban.
        std::vector<NodeId> creators() const;

        SubGraphIter ancestors(const EventRef& event) const;

        size_t size() const { return events.size(); }
        bool empty() const { return events.empty(); }

    private:
        // Az összes esemény beszúrási sorrendben (deque: stabil címek).
        std::deque<Event> events;
        std::vector<Hash> hashes;
        // Hash -> index az events tárolóban.
        std::map<Hash, size_t> indices;
        std::map<NodeId, size_t> latest;

        void validate(const Event& event) const;
    };

} // namespace Gossamer::Membership

#endif // GOSSAMER_GRAPH_HPP
