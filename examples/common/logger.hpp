#pragma once

#include <iostream>
#include <string>

#include "lcr/log/logger.hpp"


namespace spindle::examples {

    // Unknown names fall back to info
    inline void set_log_level(const std::string& log_level) {
        using namespace lcr::log;
        if (auto lvl = parse_level(log_level)) {
            Logger::instance().set_level(*lvl);
        } else {
            std::cerr << "Unknown log level '" << log_level << "', using info\n";
            Logger::instance().set_level(Level::Info);
        }
    }

} // namespace spindle::examples
