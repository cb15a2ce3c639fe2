#pragma once

#include <string>
#include <iostream>

#include "lcr/log/logger.hpp"


namespace wiregate::examples {

    // Logs go to stderr so stdout carries only event lines
    inline void set_log_level(const std::string& log_level, bool color = true) {
        using namespace lcr::log;
        Logger::instance().set_output(&std::cerr);
        Logger::instance().enable_color(color);
        Logger::instance().set_level(parse_level(log_level));
    }

} // namespace wiregate::examples
