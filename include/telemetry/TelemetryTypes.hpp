#pragma once

namespace Gossamer::Core {

    // A busz állapota
    enum class BusState {
        UP,
        DEGRADED, // Kimenő küldések hibáznak
        STOPPED
    };

    inline const char* toString(BusState state) {
        switch (state) {
            case BusState::UP:       return "UP";
            case BusState::DEGRADED: return "DEGRADED";
            case BusState::STOPPED:  return "STOPPED";
        }
        return "UNKNOWN";
    }

}
