// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#ifndef PEER_DIRECTORY_HPP
#define PEER_DIRECTORY_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "membership/NodeId.hpp"
#include "utils/NodeOptions.hpp"

namespace Gossamer::Core {

    /**
     * @brief Statikus címjegyzék: NodeId -> IPv4 host:port.
     */
    class PeerDirectory {
    public:
        PeerDirectory() = default;

        explicit PeerDirectory(const std::map<std::string, GossamerUtils::PeerAddress>& peers) {
            for (const auto& [id, address] : peers) {
                add(Membership::NodeId(id), address);
            }
        }

        void add(const Membership::NodeId& id, const GossamerUtils::PeerAddress& address) {
            peers[id] = address;
        }

        std::optional<GossamerUtils::PeerAddress> find(const Membership::NodeId& id) const {
            auto it = peers.find(id);
            if (it == peers.end()) return std::nullopt;
            return it->second;
        }

        std::vector<Membership::NodeId> ids() const {
            std::vector<Membership::NodeId> out;
            for (const auto& entry : peers) {
                out.push_back(entry.first);
            }
            return out;
        }

        size_t size() const { return peers.size(); }

    private:
        std::map<Membership::NodeId, GossamerUtils::PeerAddress> peers;
    };
}

#endif
