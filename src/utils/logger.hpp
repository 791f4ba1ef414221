#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace polygraph::utils {

/**
 * Logging system wrapper around spdlog
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical)
     * @param log_to_file Whether to log to file in addition to console
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    /**
     * Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Change the level of an initialized logger
     */
    static void set_level(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace polygraph::utils

// Convenience macros
#define POLYGRAPH_LOG_TRACE(...)    polygraph::utils::Logger::get()->trace(__VA_ARGS__)
#define POLYGRAPH_LOG_DEBUG(...)    polygraph::utils::Logger::get()->debug(__VA_ARGS__)
#define POLYGRAPH_LOG_INFO(...)     polygraph::utils::Logger::get()->info(__VA_ARGS__)
#define POLYGRAPH_LOG_WARN(...)     polygraph::utils::Logger::get()->warn(__VA_ARGS__)
#define POLYGRAPH_LOG_ERROR(...)    polygraph::utils::Logger::get()->error(__VA_ARGS__)
#define POLYGRAPH_LOG_CRITICAL(...) polygraph::utils::Logger::get()->critical(__VA_ARGS__)
