#pragma once

#include <string>

namespace GossamerUtils {

    /**
     * @brief Log-szintek a hálózati zaj kezeléséhez.
     */
    enum class LogLevel { SILENT, INFO, DEBUG };

    // "silent" | "info" | "debug", kis-nagybetű független
    LogLevel parseLogLevel(const std::string& name);
    const char* toString(LogLevel level);

}
