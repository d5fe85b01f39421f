#include "mesh_cpp/env.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <regex>
#include <system_error>

#include "mesh_cpp/logging.hpp"

namespace mesh_cpp::env {

    std::optional<std::string> Env::get(std::string_view key) const {
        const char* v = std::getenv(std::string(key).c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    }

    Result<std::uint64_t> parse_number(std::string_view s) {
        std::uint64_t out = 0;
        const char* first = s.data();
        const char* last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, out);
        if (ec == std::errc::result_out_of_range) {
            return Result<std::uint64_t>::err(Error::Code::InvalidConfig,
                                              "number out of range");
        }
        if (ec != std::errc() || ptr != last) {
            return Result<std::uint64_t>::err(Error::Code::InvalidConfig,
                                              "not a number");
        }
        return Result<std::uint64_t>::ok(out);
    }

    Result<std::chrono::milliseconds> parse_duration(std::string_view s) {
        using ms = std::chrono::milliseconds;
        static const std::regex re(R"(^\s*(\d+)(ms|s|m|h|d)?\s*$)");

        const std::string str(s);
        std::smatch cap;
        if (!std::regex_match(str, cap, re)) {
            return Result<ms>::err(Error::Code::InvalidConfig,
                                   "not a duration");
        }

        auto magnitude = parse_number(cap[1].str());
        if (magnitude.has_error()) return Result<ms>::err(magnitude.error());
        const std::uint64_t n = magnitude.value();

        std::uint64_t unit_ms = 0;
        if (!cap[2].matched) {
            if (n != 0) {
                return Result<ms>::err(Error::Code::InvalidConfig,
                                       "duration is missing a unit");
            }
            return Result<ms>::ok(0);
        }

        const std::string unit = cap[2].str();
        if (unit == "ms") {
            unit_ms = 1;
        } else if (unit == "s") {
            unit_ms = 1000;
        } else if (unit == "m") {
            unit_ms = 60ULL * 1000;
        } else if (unit == "h") {
            unit_ms = 60ULL * 60 * 1000;
        } else {
            unit_ms = 24ULL * 60 * 60 * 1000;
        }

        constexpr auto max_ms =
            static_cast<std::uint64_t>(std::numeric_limits<ms::rep>::max());
        if (n > max_ms / unit_ms) {
            return Result<ms>::err(Error::Code::InvalidConfig,
                                   "duration out of range");
        }
        return Result<ms>::ok(static_cast<ms::rep>(n * unit_ms));
    }

    namespace {
        /// @brief Wrap a parse failure with the variable name and log it.
        Error invalid_var(std::string_view name, std::string const& value,
                          Error const& cause) {
            logger()->error("{}='{}' is not valid: {}", name, value,
                            cause.message);
            return Error{Error::Code::InvalidConfig,
                         std::string(name) + " is not valid: " + cause.message};
        }
    }  // namespace

    Result<ProxyConfiguration> load_configuration(Strings const& strings) {
        ProxyConfiguration cfg;

        if (auto v = strings.get(kDiscoveryIdleTimeout)) {
            auto d = parse_duration(*v);
            if (d.has_error()) {
                return Result<ProxyConfiguration>::err(
                    invalid_var(kDiscoveryIdleTimeout, *v, d.error()));
            }
            cfg.discovery.idle_timeout = d.value();
        }

        if (auto v = strings.get(kLogLevel)) {
            if (v->empty()) {
                return Result<ProxyConfiguration>::err(invalid_var(
                    kLogLevel, *v,
                    Error{Error::Code::InvalidConfig, "empty log level"}));
            }
            cfg.log.level = *v;
        }

        if (auto v = strings.get(kLogPattern)) cfg.log.pattern = *v;

        return Result<ProxyConfiguration>::ok(std::move(cfg));
    }

}  // namespace mesh_cpp::env
