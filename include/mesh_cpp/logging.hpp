#pragma once

#include <spdlog/spdlog.h>

#include <memory>

#include "mesh_cpp/config.hpp"

namespace mesh_cpp {

    /// @brief The library logger, named "mesh_cpp".
    /// @note Created on first use with a stderr sink at info level.
    std::shared_ptr<spdlog::logger> const& logger();

    /// @brief Apply a LogConfiguration to the library logger.
    /// @return false if the level name is not recognized; the level is then
    /// left unchanged.
    bool init_logging(LogConfiguration const& cfg);

}  // namespace mesh_cpp
