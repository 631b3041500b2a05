// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "membership/Graph.hpp"
#include "membership/WireCodec.hpp"

#include <iterator>

namespace Gossamer::Membership {

    // --- SubGraphIter ---

    SubGraphIter::SubGraphIter(const Graph& graph, size_t start)
        : graph(graph), seen(graph.size(), false) {
        enqueue(start);
    }

    void SubGraphIter::enqueue(size_t index) {
        if (index >= seen.size() || seen[index]) return;
        seen[index] = true;
        nodes.insert(index);
    }

    std::optional<EventRef> SubGraphIter::next() {
        if (nodes.empty()) {
            return std::nullopt;
        }

        // Mindig a legnagyobb indexet vesszük: a szülők indexe kisebb.
        auto last = std::prev(nodes.end());
        size_t index = *last;
        nodes.erase(last);

        auto ref = graph.getByIndex(index);
        if (!ref) {
            return std::nullopt;
        }

        for (const auto& parent : {ref->event->selfParent, ref->event->otherParent}) {
            if (!parent) continue;
            if (auto parentIndex = graph.getIndex(*parent)) {
                enqueue(*parentIndex);
            }
        }
        return ref;
    }

    std::vector<EventRef> SubGraphIter::collect() {
        std::vector<EventRef> out;
        while (auto ref = next()) {
            out.push_back(*ref);
        }
        return out;
    }

    // --- Graph ---

    std::optional<size_t> Graph::getIndex(const Hash& hash) const {
        auto it = indices.find(hash);
        if (it == indices.end()) return std::nullopt;
        return it->second;
    }

    bool Graph::contains(const Hash& hash) const {
        return indices.count(hash) > 0;
    }

    bool Graph::parentsPresent(const Event& event) const {
        if (event.selfParent && !contains(*event.selfParent)) return false;
        if (event.otherParent && !contains(*event.otherParent)) return false;
        return true;
    }

    void Graph::validate(const Event& event) const {
        const bool isGenesis = event.observation.kind == ObservationKind::GENESIS;

        if (isGenesis) {
            if (event.selfParent || event.otherParent) {
                throw GraphError(GraphError::Kind::INVALID_EVENT,
                                 "genesis event by " + event.creator.str() + " has parents");
            }
            return;
        }

        if (!event.selfParent) {
            throw GraphError(GraphError::Kind::INVALID_EVENT,
                             event.observation.describe() + " event by " + event.creator.str() +
                             " has no self-parent");
        }

        auto selfIndex = getIndex(*event.selfParent);
        if (!selfIndex) {
            throw GraphError(GraphError::Kind::UNKNOWN_PARENT,
                             "unknown self-parent " + event.selfParent->shortHex());
        }
        if (events[*selfIndex].creator != event.creator) {
            throw GraphError(GraphError::Kind::INVALID_SELF_PARENT,
                             "self-parent " + event.selfParent->shortHex() + " was created by " +
                             events[*selfIndex].creator.str() + ", not " + event.creator.str());
        }

        if (event.otherParent && !contains(*event.otherParent)) {
            throw GraphError(GraphError::Kind::UNKNOWN_PARENT,
                             "unknown other-parent " + event.otherParent->shortHex());
        }
    }

    EventRef Graph::insert(const Event& event) {
        Hash hash;
        try {
            hash = hashEvent(event);
        } catch (const HashError& e) {
            throw GraphError(GraphError::Kind::HASH, e.what());
        } catch (const CodecError& e) {
            throw GraphError(GraphError::Kind::INVALID_EVENT, e.what());
        }

        auto it = indices.find(hash);
        if (it != indices.end()) {
            if (events[it->second] != event) {
                throw GraphError(GraphError::Kind::HASH_COLLISION,
                                 "hash collision on " + hash.toHex());
            }
            return EventRef{&events[it->second], it->second};
        }

        validate(event);

        size_t index = events.size();
        events.push_back(event);
        hashes.push_back(hash);
        indices.emplace(hash, index);
        latest[event.creator] = index;

        return EventRef{&events[index], index};
    }

    std::optional<EventRef> Graph::getByIndex(size_t index) const {
        if (index >= events.size()) return std::nullopt;
        return EventRef{&events[index], index};
    }

    std::optional<EventRef> Graph::getByHash(const Hash& hash) const {
        auto index = getIndex(hash);
        if (!index) return std::nullopt;
        return getByIndex(*index);
    }

    std::optional<EventRef> Graph::latestBy(const NodeId& creator) const {
        auto it = latest.find(creator);
        if (it == latest.end()) return std::nullopt;
        return getByIndex(it->second);
    }

    std::vector<NodeId> Graph::creators() const {
        std::vector<NodeId> out;
        out.reserve(latest.size());
        for (const auto& [creator, index] : latest) {
            (void)index;
            out.push_back(creator);
        }
        return out;
    }

    SubGraphIter Graph::ancestors(const EventRef& event) const {
        return SubGraphIter(*this, event.index);
    }

} // namespace Gossamer::Membership
