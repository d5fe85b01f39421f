#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace mesh_cpp {
    /**
     * @brief Configuration for a discovery cache.
     */
    struct DiscoveryCacheConfiguration {
        /** @brief How long an entry survives once its last handle is gone. */
        std::chrono::milliseconds idle_timeout{60000};
    };

    /**
     * @brief Configuration for the library logger.
     */
    struct LogConfiguration {
        /** @brief spdlog level name: trace, debug, info, warn, error, off. */
        std::string level{"info"};

        /** @brief spdlog pattern used by the stderr sink. */
        std::string pattern{"[%Y-%m-%dT%H:%M:%S.%eZ] [%^%l%$] [%n] %v"};
    };

    /**
     * @brief Static tunables supplied to the proxy core.
     */
    struct ProxyConfiguration {
        DiscoveryCacheConfiguration discovery;
        LogConfiguration log;
    };
}  // namespace mesh_cpp
