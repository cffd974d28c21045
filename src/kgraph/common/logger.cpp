#include "kgraph/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace kgraph {
namespace common {

void Logger::Init() {
    try {
        auto console = spdlog::get("kgraph");
        if (!console) {
            console = spdlog::stdout_color_mt("kgraph");
        }
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

bool Logger::SetLevel(const std::string& level_name) {
    auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && level_name != "off") {
        return false;
    }
    spdlog::set_level(level);
    return true;
}

} // namespace common
} // namespace kgraph
