#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace spaserve {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void set_level(Level level);
    static Level level();
    static bool enabled(Level level);
    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Parses "debug", "info", "warn", "error" or "none" (case-insensitive)
std::optional<Level> parse_level(const std::string &level_str);

const char *level_to_string(Level level);

}  // namespace logging
}  // namespace spaserve

// Builds the message with operator<< only when the level is enabled
#define LOG_INTERNAL(level, msg)                                                  \
    do {                                                                          \
        if (spaserve::logging::Logger::enabled(level)) {                          \
            std::stringstream ss;                                                 \
            ss << msg;                                                            \
            spaserve::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
        }                                                                         \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(spaserve::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(spaserve::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(spaserve::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(spaserve::logging::Level::LVL_ERROR, msg)
