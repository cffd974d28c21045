#ifndef KGRAPH_COMMON_LOGGER_H_
#define KGRAPH_COMMON_LOGGER_H_

#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace kgraph {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Set the level from a config string ("trace", "debug", "info", ...)
     *
     * Unknown names leave the current level untouched and return false.
     */
    static bool SetLevel(const std::string& level_name);
};

} // namespace common
} // namespace kgraph

// Macros for convenient logging
#define KGRAPH_TRACE(...) spdlog::trace(__VA_ARGS__)
#define KGRAPH_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define KGRAPH_INFO(...)  spdlog::info(__VA_ARGS__)
#define KGRAPH_WARN(...)  spdlog::warn(__VA_ARGS__)
#define KGRAPH_ERROR(...) spdlog::error(__VA_ARGS__)
#define KGRAPH_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // KGRAPH_COMMON_LOGGER_H_
