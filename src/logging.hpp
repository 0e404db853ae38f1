#ifndef CONSENT_LOGGING_HPP
#define CONSENT_LOGGING_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace consent {
namespace log {

enum class Level : uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Off   = 5
};

struct Record {
    Level       level;
    std::string category;  // component name, e.g. "contracts"
    std::string message;
    std::string timestamp; // ISO-8601 UTC
};

using Sink = std::function<void(const Record&)>;

// Process-wide threshold. Records below it are dropped before formatting.
void set_level(Level level);
Level level();
bool enabled(Level level);

// Replace the output sink. An empty function restores the stderr sink.
void set_sink(Sink sink);

const char* level_name(Level level);

// Accepts "trace", "debug", "info", "warn", "error", "off" (any case).
// Throws std::invalid_argument on anything else.
Level parse_level(const std::string& text);

void write(Level level, const std::string& category, const std::string& message);

inline void trace(const std::string& category, const std::string& message) { write(Level::Trace, category, message); }
inline void debug(const std::string& category, const std::string& message) { write(Level::Debug, category, message); }
inline void info(const std::string& category, const std::string& message)  { write(Level::Info, category, message); }
inline void warn(const std::string& category, const std::string& message)  { write(Level::Warn, category, message); }
inline void error(const std::string& category, const std::string& message) { write(Level::Error, category, message); }

} // namespace log
} // namespace consent

#endif // CONSENT_LOGGING_HPP
