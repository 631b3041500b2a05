// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "membership/FailureDetector.hpp"

namespace Gossamer::Membership {

    InternalFailureDetector::InternalFailureDetector(std::chrono::milliseconds timeout, Clock clock)
        : timeout(timeout), clock(std::move(clock)) {
        if (timeout.count() <= 0) {
            throw FailureDetectorError("timeout must be positive, got " +
                                       std::to_string(timeout.count()) + "ms");
        }
        if (!this->clock) {
            throw FailureDetectorError("no clock configured");
        }
    }

    void InternalFailureDetector::pollFailures() {
        const TimePoint now = clock();
        for (const auto& [node, seen] : lastSeen) {
            if (reported.count(node)) continue;
            if (now - seen > timeout) {
                failures.push_back(node);
                reported.insert(node);
            }
        }
    }

    std::vector<NodeId> InternalFailureDetector::dequeueFailures() {
        std::vector<NodeId> out;
        out.swap(failures);
        return out;
    }

    void InternalFailureDetector::monitor(const std::set<NodeId>& group) {
        const TimePoint now = clock();

        // Akik kikerültek a csoportból, azokat elfelejtjük.
        for (auto it = lastSeen.begin(); it != lastSeen.end();) {
            if (group.count(it->first) == 0) {
                reported.erase(it->first);
                it = lastSeen.erase(it);
            } else {
                ++it;
            }
        }

        for (const auto& node : group) {
            lastSeen.emplace(node, now);
        }
    }

    void InternalFailureDetector::recordHeartbeat(const NodeId& node) {
        auto it = lastSeen.find(node);
        if (it == lastSeen.end()) return;
        it->second = clock();
        reported.erase(node);
    }

} // namespace Gossamer::Membership
