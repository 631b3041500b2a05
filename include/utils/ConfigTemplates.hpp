#ifndef CONFIGTEMPLATES_HPP
#define CONFIGTEMPLATES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace GossamerTemplates {

    // Hálózat
    constexpr uint16_t DEFAULT_LISTEN_PORT = 7946;
    constexpr size_t DEFAULT_MAX_FRAME_BYTES = 4 * 1024 * 1024;

    // Időzítések (ms)
    constexpr long DEFAULT_FAILURE_TIMEOUT_MS = 3000;
    constexpr long DEFAULT_HEARTBEAT_INTERVAL_MS = 500;
    constexpr long DEFAULT_TICK_INTERVAL_MS = 100;
    constexpr long DEFAULT_SYNC_INTERVAL_MS = 2000;

    constexpr size_t DEFAULT_MAX_PENDING_EVENTS = 1024;

    // Minta konfiguráció (--print-config), key=value soronként
    extern const std::vector<std::string> SAMPLE_CONFIG_CONTENT;
}

#endif
