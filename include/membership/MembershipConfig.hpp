// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#ifndef GOSSAMER_MEMBERSHIP_CONFIG_HPP
#define GOSSAMER_MEMBERSHIP_CONFIG_HPP

#include <chrono>
#include <cstddef>

#include "membership/FailureDetector.hpp"

namespace Gossamer::Membership {

    struct MembershipConfig {
        // Ennyi csend után tekintünk egy tagot kiesettnek.
        std::chrono::milliseconds failureTimeout{3000};

        // Heartbeat üzenet gyakorisága poll() hívásokból.
        std::chrono::milliseconds heartbeatInterval{500};

        // Hiányzó szülőre váró események felső korlátja.
        size_t maxPendingEvents = 1024;

        Clock clock = systemClock();
    };

} // namespace Gossamer::Membership

#endif // GOSSAMER_MEMBERSHIP_CONFIG_HPP
