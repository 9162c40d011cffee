#pragma once

#include <string>

#include "lcr/log/logger.hpp"


namespace twinkit::examples {

    // Applies a CLI log level name ("trace" | "debug" | "info" | "warn" | "error" | "off")
    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        Logger::instance().set_level(level_from_string(log_level));
    }

} // namespace twinkit::examples
