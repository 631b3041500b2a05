// © 2026 Beatrix Zselezny. All rights reserved.
// Gossamer Membership Framework

#include "utils/NodeOptions.hpp"
#include "utils/StringUtils.hpp"
#include "membership/WireCodec.hpp"

#include <arpa/inet.h>

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace GossamerUtils {

    namespace {
        std::chrono::milliseconds parseMillis(const std::string& value, const std::string& key) {
            auto ms = parseUnsigned(value, 24ULL * 3600 * 1000, key);
            if (ms == 0) {
                throw std::runtime_error(key + " must be positive");
            }
            return std::chrono::milliseconds(static_cast<long>(ms));
        }

        // A node id a drótra kerül: a dekóder korlátja itt is érvényes.
        const std::string& checkNodeId(const std::string& id, const std::string& what) {
            if (id.empty()) {
                throw std::runtime_error(what + " must not be empty");
            }
            if (id.size() > Gossamer::Membership::MAX_STRING_BYTES) {
                throw std::runtime_error(what + " is longer than " +
                                         std::to_string(Gossamer::Membership::MAX_STRING_BYTES) + " bytes");
            }
            return id;
        }

        // CLI kapcsoló -> config kulcs
        const std::map<std::string, std::string> FLAG_KEYS = {
            {"--id", "id"},
            {"--listen", "listen"},
            {"--peer", "peer"},
            {"--genesis", "genesis"},
            {"--timeout", "timeout_ms"},
            {"--heartbeat", "heartbeat_ms"},
            {"--tick", "tick_ms"},
            {"--sync", "sync_ms"},
            {"--max-frame-bytes", "max_frame_bytes"},
            {"--max-pending", "max_pending_events"},
            {"--log-level", "log_level"}
        };
    }

    LogLevel parseLogLevel(const std::string& name) {
        std::string n = toLower(trim(name));
        if (n == "silent") return LogLevel::SILENT;
        if (n == "info") return LogLevel::INFO;
        if (n == "debug") return LogLevel::DEBUG;
        throw std::runtime_error("unknown log level '" + name + "' (silent|info|debug)");
    }

    const char* toString(LogLevel level) {
        switch (level) {
            case LogLevel::SILENT: return "silent";
            case LogLevel::INFO:   return "info";
            case LogLevel::DEBUG:  return "debug";
        }
        return "unknown";
    }

    PeerAddress parsePeerAddress(const std::string& text) {
        std::string t = trim(text);
        size_t colon = t.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == t.size()) {
            throw std::runtime_error("peer address must be host:port, got '" + text + "'");
        }

        PeerAddress address;
        address.host = t.substr(0, colon);

        in_addr parsed{};
        if (inet_pton(AF_INET, address.host.c_str(), &parsed) != 1) {
            throw std::runtime_error("peer host must be an IPv4 address, got '" + address.host + "'");
        }

        auto port = parseUnsigned(t.substr(colon + 1), std::numeric_limits<uint16_t>::max(), "peer port");
        if (port == 0) {
            throw std::runtime_error("peer port must not be 0");
        }
        address.port = static_cast<uint16_t>(port);
        return address;
    }

    void applySetting(NodeOptions& options, const std::string& rawKey, const std::string& rawValue) {
        const std::string key = trim(rawKey);
        const std::string value = trim(rawValue);

        if (key == "id") {
            options.id = checkNodeId(value, "id");
        } else if (key == "listen") {
            auto port = parseUnsigned(value, std::numeric_limits<uint16_t>::max(), "listen");
            if (port == 0) throw std::runtime_error("listen port must not be 0");
            options.listenPort = static_cast<uint16_t>(port);
        } else if (key == "peer") {
            // peer=<id>=<host>:<port>
            size_t eq = value.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::runtime_error("peer must be <id>=<host>:<port>, got '" + value + "'");
            }
            std::string peerId = checkNodeId(trim(value.substr(0, eq)), "peer id");
            if (options.peers.count(peerId)) {
                throw std::runtime_error("duplicate peer '" + peerId + "'");
            }
            options.peers.emplace(peerId, parsePeerAddress(value.substr(eq + 1)));
        } else if (key == "genesis") {
            auto nodes = split(value, ',');
            if (nodes.empty()) throw std::runtime_error("genesis must list at least one node");
            if (nodes.size() > Gossamer::Membership::MAX_GENESIS_NODES) {
                throw std::runtime_error("genesis lists more than " +
                                         std::to_string(Gossamer::Membership::MAX_GENESIS_NODES) + " nodes");
            }
            for (const auto& node : nodes) checkNodeId(node, "genesis entry");
            options.genesis = std::set<std::string>(nodes.begin(), nodes.end());
        } else if (key == "timeout_ms") {
            options.failureTimeout = parseMillis(value, key);
        } else if (key == "heartbeat_ms") {
            options.heartbeatInterval = parseMillis(value, key);
        } else if (key == "tick_ms") {
            options.tickInterval = parseMillis(value, key);
        } else if (key == "sync_ms") {
            options.syncInterval = parseMillis(value, key);
        } else if (key == "max_frame_bytes") {
            options.maxFrameBytes = static_cast<size_t>(
                parseUnsigned(value, std::numeric_limits<uint32_t>::max(), key));
        } else if (key == "max_pending_events") {
            options.maxPendingEvents = static_cast<size_t>(parseUnsigned(value, 1u << 24, key));
        } else if (key == "log_level") {
            options.logLevel = parseLogLevel(value);
        } else {
            throw std::runtime_error("unknown setting '" + key + "'");
        }
    }

    void applyConfigFile(NodeOptions& options, const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open config file: " + path);
        }

        std::string line;
        size_t lineNo = 0;
        while (std::getline(file, line)) {
            ++lineNo;
            std::string t = trim(line);
            // Kommentek és üres sorok kihagyása
            if (t.empty() || t[0] == '#') continue;

            size_t pos = t.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error(path + ":" + std::to_string(lineNo) + ": expected key=value");
            }
            try {
                applySetting(options, t.substr(0, pos), t.substr(pos + 1));
            } catch (const std::runtime_error& e) {
                throw std::runtime_error(path + ":" + std::to_string(lineNo) + ": " + e.what());
            }
        }
    }

    void finalizeOptions(NodeOptions& options) {
        if (options.id.empty()) {
            throw std::runtime_error("node id is required (--id or id=)");
        }
        if (options.peers.count(options.id)) {
            throw std::runtime_error("node '" + options.id + "' lists itself as a peer");
        }
        if (options.genesis.empty()) {
            options.genesis.insert(options.id);
            for (const auto& [peerId, address] : options.peers) {
                (void)address;
                options.genesis.insert(peerId);
            }
        }
        if (options.heartbeatInterval >= options.failureTimeout) {
            throw std::runtime_error("heartbeat interval must be shorter than the failure timeout");
        }
        if (options.maxFrameBytes < 64) {
            throw std::runtime_error("max_frame_bytes must be at least 64");
        }
    }

    NodeOptions parseNodeOptions(int argc, const char* const argv[]) {
        NodeOptions options;

        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);

            if (arg == "--help" || arg == "-h") {
                options.showHelp = true;
                continue;
            }
            if (arg == "--print-config") {
                options.printConfig = true;
                continue;
            }

            if (i + 1 >= argc) {
                throw std::runtime_error("missing value for " + arg);
            }
            std::string value(argv[++i]);

            if (arg == "--config") {
                applyConfigFile(options, value);
                continue;
            }

            auto it = FLAG_KEYS.find(arg);
            if (it == FLAG_KEYS.end()) {
                throw std::runtime_error("unknown option " + arg);
            }
            applySetting(options, it->second, value);
        }

        if (!options.showHelp && !options.printConfig) {
            finalizeOptions(options);
        }
        return options;
    }

    std::string usage(const std::string& program) {
        std::ostringstream os;
        os << "Usage: " << program << " --id <id> [options]\n"
           << "  --config <path>          key=value config file (later flags override)\n"
           << "  --listen <port>          TCP listen port (default "
           << GossamerTemplates::DEFAULT_LISTEN_PORT << ")\n"
           << "  --peer <id>=<ip>:<port>  peer address, repeatable\n"
           << "  --genesis <a,b,c>        initial group (default: id + peers)\n"
           << "  --timeout <ms>           failure timeout\n"
           << "  --heartbeat <ms>         heartbeat interval\n"
           << "  --tick <ms>              poll interval\n"
           << "  --sync <ms>              anti-entropy interval\n"
           << "  --max-frame-bytes <n>    inbound frame limit\n"
           << "  --max-pending <n>        events waiting for parents\n"
           << "  --log-level <level>      silent | info | debug\n"
           << "  --print-config           print a sample config file\n"
           << "  --help\n";
        return os.str();
    }
}
