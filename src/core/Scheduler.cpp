// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "core/Scheduler.hpp"
#include "core/GossipBus.hpp"
#include <iostream>

namespace Gossamer::Core {
    Scheduler::Scheduler() {
        vent_scheduler = rxcpp::schedulers::make_event_loop();

        // Egy szál, egy worker: minden cortex feladat ugyanide kerül.
        cortex_worker = rxcpp::schedulers::make_new_thread().create_worker(lifetime);
        cortex_scheduler = rxcpp::schedulers::make_same_worker(cortex_worker);
    }

    Scheduler::~Scheduler() {
        stop();
        // A cortex worker szála is a lifetime-hoz kötött.
        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }
    }

    void Scheduler::start(GossipBus& bus, std::chrono::milliseconds tickInterval) {
        if (running) return;
        running = true;

        bus.startReactive(lifetime, *this);

        rxcpp::observable<>::interval(tickInterval, rxcpp::observe_on_one_worker(cortex_scheduler))
            .subscribe(lifetime, [&bus](auto) { bus.tick(); });

        std::cout << "[Scheduler] Tick every " << tickInterval.count() << "ms on the cortex worker." << std::endl;
    }

    void Scheduler::stop() {
        if (!running) return;

        if (lifetime.is_subscribed()) {
            lifetime.unsubscribe();
        }

        running = false;
    }
}
