#pragma once

#include <cstdint>
#include "telemetry/TelemetryTypes.hpp"

namespace Gossamer::Core {

    struct TelemetrySnapshot {
        // --- Inbound traffic ---
        uint64_t total;
        uint64_t accepted;
        uint64_t null_routed;  // Dekódolhatatlan frame-ek
        uint64_t rejected;     // Dekódolt, de a state machine elutasította

        // --- Outbound traffic ---
        uint64_t sent;
        uint64_t send_failures;

        // --- Queue Metrics ---
        uint32_t queue_current;
        uint32_t queue_peak;

        // --- Membership ---
        uint32_t group_size;
        uint64_t graph_events;
        uint64_t pending_events;

        BusState state;
        uint64_t window_ms;
    };

}
