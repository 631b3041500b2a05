// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework
// Dual-worker Scheduler: network sends vs. the membership state machine

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include "rxcpp/rx.hpp"

namespace Gossamer::Core {

    class GossipBus; // Forward declaration

    /**
     * @brief A Gossamer node ütemezője.
     */
    class Scheduler {
    private:
        // --- State ---
        std::atomic<bool> running{false};

        // A fő subscription, ami életben tartja a folyamatokat.
        rxcpp::composite_subscription lifetime;

        // --- RxCpp Schedulers ---

        // 1. Vent: event loop a kimenő küldésekhez
        rxcpp::schedulers::scheduler vent_scheduler;

        // 2. Cortex: egyetlen, dedikált worker; a NodeMembership csak itt fut
        rxcpp::schedulers::worker cortex_worker;
        rxcpp::schedulers::scheduler cortex_scheduler;

    public:
        Scheduler();
        ~Scheduler();

        Scheduler(const Scheduler&) = delete;
        Scheduler& operator=(const Scheduler&) = delete;

        /**
         * @brief Reaktív lánc felépítése és a periodikus tick indítása.
         */
        void start(GossipBus& bus, std::chrono::milliseconds tickInterval);
        void stop();

        bool isRunning() const { return running.load(); }

        // --- Accessors ---
        rxcpp::composite_subscription& getLifetime() { return lifetime; }

        rxcpp::schedulers::scheduler getVentScheduler() const {
            return vent_scheduler;
        }

        rxcpp::schedulers::scheduler getCortexScheduler() const {
            return cortex_scheduler;
        }
    };
}

#endif // SCHEDULER_HPP
