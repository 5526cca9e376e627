#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace opr {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static bool enabled(Level level);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Parses "debug", "info", "warn", "error" (any case). Unknown strings map to INFO.
Level string_to_level(const std::string &level_str);

// True when level_str names one of the levels accepted by string_to_level
bool is_valid_level(const std::string &level_str);

}  // namespace logging
}  // namespace opr

// Stream-style message building: LOG_INFO("[HTTP] port " << port)
#define OPR_LOG_INTERNAL(level, msg)                                  \
    do {                                                              \
        if (opr::logging::Logger::enabled(level)) {                   \
            std::stringstream ss;                                     \
            ss << msg;                                                \
            opr::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
        }                                                             \
    } while (0)

#define LOG_DEBUG(msg) OPR_LOG_INTERNAL(opr::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) OPR_LOG_INTERNAL(opr::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) OPR_LOG_INTERNAL(opr::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) OPR_LOG_INTERNAL(opr::logging::Level::LVL_ERROR, msg)
