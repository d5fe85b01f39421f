#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "mesh_cpp/config.hpp"
#include "mesh_cpp/result.hpp"

namespace mesh_cpp::env {

    inline constexpr std::string_view kDiscoveryIdleTimeout =
        "MESH_PROXY_DISCOVERY_IDLE_TIMEOUT";
    inline constexpr std::string_view kLogLevel = "MESH_PROXY_LOG";
    inline constexpr std::string_view kLogPattern = "MESH_PROXY_LOG_PATTERN";

    /**
     * @brief A source of configuration strings keyed by variable name.
     */
    class Strings {
       public:
        virtual ~Strings() = default;

        /// @brief Look up a variable; nullopt when it is not set.
        virtual std::optional<std::string> get(std::string_view key) const = 0;
    };

    /**
     * @brief Strings backed by the process environment.
     */
    class Env : public Strings {
       public:
        std::optional<std::string> get(std::string_view key) const override;
    };

    /// @brief Parse an unsigned decimal number, rejecting overflow and any
    /// trailing characters.
    Result<std::uint64_t> parse_number(std::string_view s);

    /// @brief Parse a duration such as "500ms", "10s", "5m", "1h" or "2d".
    /// @note A number without a unit is accepted only when it is 0.
    Result<std::chrono::milliseconds> parse_duration(std::string_view s);

    /// @brief Build a ProxyConfiguration from the given strings, using
    /// defaults for unset variables.
    /// @return InvalidConfig naming the first variable that fails to parse.
    Result<ProxyConfiguration> load_configuration(Strings const& strings);

}  // namespace mesh_cpp::env
