// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#ifndef GOSSAMER_NODE_ID_HPP
#define GOSSAMER_NODE_ID_HPP

#include <ostream>
#include <stdexcept>
#include <string>

namespace Gossamer::Membership {

    /**
     * @brief Egy peer node egyedi azonosítója.
     * Átlátszatlan, sosem üres, teljesen rendezett string.
     */
    class NodeId {
    public:
        explicit NodeId(std::string value) : value_(std::move(value)) {
            if (value_.empty()) {
                throw std::invalid_argument("NodeId must not be empty");
            }
        }

        const std::string& str() const { return value_; }

        bool operator==(const NodeId& other) const { return value_ == other.value_; }
        bool operator!=(const NodeId& other) const { return value_ != other.value_; }
        bool operator<(const NodeId& other) const { return value_ < other.value_; }

    private:
        std::string value_;
    };

    inline std::ostream& operator<<(std::ostream& os, const NodeId& id) {
        return os << id.str();
    }

} // namespace Gossamer::Membership

#endif // GOSSAMER_NODE_ID_HPP
