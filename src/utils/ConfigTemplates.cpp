#include "utils/ConfigTemplates.hpp"

namespace GossamerTemplates {

    const std::vector<std::string> SAMPLE_CONFIG_CONTENT = {
        "# Gossamer node - sample configuration",
        "id=node-a",
        "listen=7946",
        "# peer=<id>=<ipv4>:<port>, one line per peer",
        "peer=node-b=127.0.0.1:7947",
        "peer=node-c=127.0.0.1:7948",
        "# Initial group; defaults to id plus all peers",
        "genesis=node-a,node-b,node-c",
        "timeout_ms=3000",
        "heartbeat_ms=500",
        "tick_ms=100",
        "sync_ms=2000",
        "max_frame_bytes=4194304",
        "max_pending_events=1024",
        "# silent | info | debug",
        "log_level=info"
    };
}
