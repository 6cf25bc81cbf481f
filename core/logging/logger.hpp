#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace micsync {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();

    // True when a message at this level would be written
    static bool enabled(Level level);

    static void log(Level level, const char *file, int line, const std::string &message);

private:
    static std::atomic<Level> threshold_;
    static std::mutex mutex_;
};

// Parses "debug", "info", "warn", "error", "none" (case-insensitive). Unknown -> INFO.
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace micsync

#define MICSYNC_LOG_INTERNAL(level, msg)                                           \
    do {                                                                           \
        if (micsync::logging::Logger::enabled(level)) {                            \
            std::stringstream ss;                                                  \
            ss << msg;                                                             \
            micsync::logging::Logger::log(level, __FILE__, __LINE__, ss.str());    \
        }                                                                          \
    } while (0)

#define LOG_DEBUG(msg) MICSYNC_LOG_INTERNAL(micsync::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) MICSYNC_LOG_INTERNAL(micsync::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) MICSYNC_LOG_INTERNAL(micsync::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) MICSYNC_LOG_INTERNAL(micsync::logging::Level::LVL_ERROR, msg)
