// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#ifndef NODE_OPTIONS_HPP
#define NODE_OPTIONS_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>

#include "utils/ConfigTemplates.hpp"
#include "utils/LogLevel.hpp"

namespace GossamerUtils {

    struct PeerAddress {
        std::string host; // IPv4, pontozott alak
        uint16_t port = 0;
    };

    struct NodeOptions {
        std::string id;
        uint16_t listenPort = GossamerTemplates::DEFAULT_LISTEN_PORT;

        // Peer id -> cím
        std::map<std::string, PeerAddress> peers;

        // Üres esetén: id + minden peer
        std::set<std::string> genesis;

        std::chrono::milliseconds failureTimeout{GossamerTemplates::DEFAULT_FAILURE_TIMEOUT_MS};
        std::chrono::milliseconds heartbeatInterval{GossamerTemplates::DEFAULT_HEARTBEAT_INTERVAL_MS};
        std::chrono::milliseconds tickInterval{GossamerTemplates::DEFAULT_TICK_INTERVAL_MS};
        std::chrono::milliseconds syncInterval{GossamerTemplates::DEFAULT_SYNC_INTERVAL_MS};

        size_t maxFrameBytes = GossamerTemplates::DEFAULT_MAX_FRAME_BYTES;
        size_t maxPendingEvents = GossamerTemplates::DEFAULT_MAX_PENDING_EVENTS;

        LogLevel logLevel = LogLevel::INFO;

        bool showHelp = false;
        bool printConfig = false;
    };

    /**
     * @brief "host:port" feldolgozása. Csak IPv4 literált fogadunk el.
     * @throws std::runtime_error
     */
    PeerAddress parsePeerAddress(const std::string& text);

    /**
     * @brief Egy key=value beállítás alkalmazása (config fájl és CLI közös útja).
     * @throws std::runtime_error ismeretlen kulcs vagy hibás érték esetén.
     */
    void applySetting(NodeOptions& options, const std::string& key, const std::string& value);

    /**
     * @brief key=value config fájl beolvasása; '#' kezdetű és üres sorok kimaradnak.
     * @throws std::runtime_error ha a fájl nem olvasható vagy hibás.
     */
    void applyConfigFile(NodeOptions& options, const std::string& path);

    /**
     * @brief Parancssor feldolgozása, majd a kötelező mezők ellenőrzése.
     * @throws std::runtime_error
     */
    NodeOptions parseNodeOptions(int argc, const char* const argv[]);

    // Alapértékek kitöltése és konzisztencia-ellenőrzés.
    void finalizeOptions(NodeOptions& options);

    std::string usage(const std::string& program);
}

#endif
