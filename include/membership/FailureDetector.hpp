// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework
// Local failure detection: only this node's own observations are used

#ifndef GOSSAMER_FAILURE_DETECTOR_HPP
#define GOSSAMER_FAILURE_DETECTOR_HPP

#include <chrono>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "membership/NodeId.hpp"

namespace Gossamer::Membership {

    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    inline Clock systemClock() {
        return [] { return std::chrono::steady_clock::now(); };
    }

    class FailureDetectorError : public std::runtime_error {
    public:
        explicit FailureDetectorError(const std::string& what)
            : std::runtime_error("Failure detector error: " + what) {}
    };

    /**
     * @brief Node hiba-detektor interfész.
     */
    class FailureDetector {
    public:
        virtual ~FailureDetector() = default;

        /**
         * @brief Új hibák keresése; a talált node-ok a hiba-sorba kerülnek.
         * @throws FailureDetectorError
         */
        virtual void pollFailures() = 0;

        /**
         * @brief Kiveszi és visszaadja a még feldolgozatlan hibákat.
         */
        virtual std::vector<NodeId> dequeueFailures() = 0;

        // A figyelt csoport cseréje (a saját node-ot nem kell átadni).
        virtual void monitor(const std::set<NodeId>& group) = 0;

        virtual void recordHeartbeat(const NodeId& node) = 0;
    };

    /**
     * @brief Timeout alapú, belső hiba-detektor.
     *
     * Egy figyelt node, amelytől a timeout-nál tovább nem jött üzenet, pontosan
     * egyszer kerül a hiba-sorba. Egy későbbi heartbeat újra élesíti.
     */
    class InternalFailureDetector : public FailureDetector {
    public:
        explicit InternalFailureDetector(std::chrono::milliseconds timeout, Clock clock = systemClock());

        void pollFailures() override;
        std::vector<NodeId> dequeueFailures() override;
        void monitor(const std::set<NodeId>& group) override;
        void recordHeartbeat(const NodeId& node) override;

        bool isSuspected(const NodeId& node) const { return reported.count(node) > 0; }
        size_t watchedCount() const { return lastSeen.size(); }

    private:
        std::chrono::milliseconds timeout;
        Clock clock;

        std::map<NodeId, TimePoint> lastSeen;
        std::set<NodeId> reported;

        // A feldolgozatlan hibák sora.
        std::vector<NodeId> failures;
    };

} // namespace Gossamer::Membership

#endif // GOSSAMER_FAILURE_DETECTOR_HPP
