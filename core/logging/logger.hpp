#pragma once

#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace pulse {
namespace logging {

enum class Level { LVL_DEBUG, LVL_INFO, LVL_WARN, LVL_ERROR, LVL_NONE };

class Logger {
public:
    // Receives every line that passes the threshold, after it is written to stderr
    using Sink = std::function<void(Level level, const std::string &message)>;

    static void init(Level threshold);
    static void set_level(Level level);
    static Level level();

    static void log(Level level, const char *file, int line, const std::string &message);

    // Install an additional sink (pass nullptr to remove). Used by tests and
    // by hosts that mirror worker output elsewhere.
    static void set_sink(Sink sink);

private:
    static Level threshold_;
    static Sink sink_;
    static std::mutex mutex_;
};

// Config string ("debug", "info", ...) to Level; unknown strings map to INFO
Level string_to_level(const std::string &level_str);
const char *level_to_string(Level level);

}  // namespace logging
}  // namespace pulse

#define LOG_INTERNAL(level, msg)                                          \
    do {                                                                  \
        std::stringstream ss_;                                            \
        ss_ << msg;                                                       \
        pulse::logging::Logger::log(level, __FILE__, __LINE__, ss_.str()); \
    } while (0)

#define LOG_DEBUG(msg) LOG_INTERNAL(pulse::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LOG_INTERNAL(pulse::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LOG_INTERNAL(pulse::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LOG_INTERNAL(pulse::logging::Level::LVL_ERROR, msg)
