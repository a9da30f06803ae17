#pragma once

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace tether {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    // Receives every message that passes the threshold, already formatted
    // without timestamp. Used to capture output in tests.
    using Sink = std::function<void(Level, const std::string &)>;

    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();

    // Replaces stderr output with a sink; pass nullptr to restore stderr
    static void set_sink(Sink sink);

private:
    static Level threshold_;
    static Sink sink_;
    static std::mutex mutex_;
};

// Helpers to convert Level to/from string for config parsing
Level string_to_level(const std::string& level_str);
const char *level_to_string(Level level);

} // namespace logging
} // namespace tether

// Macro macros to handle string building
#define LOG_INTERNAL(level, msg) \
    do { \
        std::stringstream ss; \
        ss << msg; \
        tether::logging::Logger::log(level, __FILE__, __LINE__, ss.str()); \
    } while(0)

#define LOG_DEBUG(msg) LOG_INTERNAL(tether::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  LOG_INTERNAL(tether::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  LOG_INTERNAL(tether::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(tether::logging::Level::LVL_ERROR, msg)
