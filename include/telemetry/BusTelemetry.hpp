#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "telemetry/TelemetryTypes.hpp"
#include "telemetry/TelemetrySnapshot.hpp"

namespace Gossamer::Core {

struct BusTelemetry {
    // Inbound counters
    std::atomic<uint64_t> total_frames{0};
    std::atomic<uint64_t> accepted_frames{0};
    std::atomic<uint64_t> null_routed_frames{0};
    std::atomic<uint64_t> rejected_messages{0};

    // Outbound counters
    std::atomic<uint64_t> sent_messages{0};
    std::atomic<uint64_t> send_failures{0};

    // Queue metrics
    std::atomic<uint32_t> queue_depth{0};
    std::atomic<uint32_t> peak_queue_depth{0};

    // Membership gauges (a cortex worker frissíti)
    std::atomic<uint32_t> group_size{0};
    std::atomic<uint64_t> graph_events{0};
    std::atomic<uint64_t> pending_events{0};

    // Bus state
    std::atomic<BusState> state{BusState::UP};

    // Time window
    std::chrono::steady_clock::time_point window_start;

    BusTelemetry();

    void frame_enqueued();
    void frame_done();

    [[nodiscard]] TelemetrySnapshot snapshot() const;
    void reset_window();
};

}
