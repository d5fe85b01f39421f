#include "mesh_cpp/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mesh_cpp {

    namespace {
        constexpr const char* kLoggerName = "mesh_cpp";

        std::shared_ptr<spdlog::logger> make_logger() {
            // An application may have registered its own logger under our
            // name before the first log line; reuse it.
            if (auto existing = spdlog::get(kLoggerName)) return existing;
            auto lg = spdlog::stderr_color_mt(kLoggerName);
            lg->set_level(spdlog::level::info);
            return lg;
        }
    }  // namespace

    std::shared_ptr<spdlog::logger> const& logger() {
        static const std::shared_ptr<spdlog::logger> lg = make_logger();
        return lg;
    }

    bool init_logging(LogConfiguration const& cfg) {
        auto const& lg = logger();
        if (!cfg.pattern.empty()) lg->set_pattern(cfg.pattern);

        // from_str() maps unknown names to "off"
        auto level = spdlog::level::from_str(cfg.level);
        if (level == spdlog::level::off && cfg.level != "off") {
            lg->warn("Unknown log level '{}', keeping {}", cfg.level,
                     spdlog::level::to_string_view(lg->level()));
            return false;
        }
        lg->set_level(level);
        return true;
    }

}  // namespace mesh_cpp
