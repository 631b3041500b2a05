// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "telemetry/BusTelemetry.hpp"

namespace Gossamer::Core {

BusTelemetry::BusTelemetry()
    : window_start(std::chrono::steady_clock::now())
{
}

void BusTelemetry::frame_enqueued() {
    total_frames++;
    uint32_t depth = ++queue_depth;

    // Csúcsérték frissítése CAS ciklussal
    uint32_t peak = peak_queue_depth.load();
    while (depth > peak && !peak_queue_depth.compare_exchange_weak(peak, depth)) {
    }
}

// Közvetlen processFrame() hívásnál nincs mit levonni.
void BusTelemetry::frame_done() {
    uint32_t depth = queue_depth.load();
    while (depth > 0 && !queue_depth.compare_exchange_weak(depth, depth - 1)) {
    }
}

void BusTelemetry::reset_window() {
    peak_queue_depth.store(queue_depth.load());
    window_start = std::chrono::steady_clock::now();
}

TelemetrySnapshot BusTelemetry::snapshot() const {
    TelemetrySnapshot snap{};

    snap.total       = total_frames.load();
    snap.accepted    = accepted_frames.load();
    snap.null_routed = null_routed_frames.load();
    snap.rejected    = rejected_messages.load();

    snap.sent          = sent_messages.load();
    snap.send_failures = send_failures.load();

    snap.queue_current = queue_depth.load();
    snap.queue_peak    = peak_queue_depth.load();

    snap.group_size     = group_size.load();
    snap.graph_events   = graph_events.load();
    snap.pending_events = pending_events.load();

    snap.state = state.load();

    snap.window_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - window_start
        ).count();

    return snap;
}

} // namespace Gossamer::Core
