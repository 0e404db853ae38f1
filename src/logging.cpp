#include "logging.hpp"
#include "helpers.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace consent {
namespace log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex         g_sink_mu;
Sink               g_sink;

void stderr_sink(const Record& rec) {
    std::ostringstream oss;
    oss << rec.timestamp << " [" << level_name(rec.level) << "] [" << rec.category << "] "
        << rec.message << "\n";
    std::cerr << oss.str();
}

} // namespace

void set_level(Level lvl) {
    g_level.store(lvl, std::memory_order_relaxed);
}

Level level() {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) {
    return lvl != Level::Off && lvl >= level();
}

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mu);
    g_sink = std::move(sink);
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
    }
    return "?";
}

Level parse_level(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info")  return Level::Info;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "off")   return Level::Off;
    throw std::invalid_argument("Unknown log level: " + text);
}

void write(Level lvl, const std::string& category, const std::string& message) {
    if (!enabled(lvl)) return;

    Record rec{lvl, category, message, utils::format_timestamp(utils::now_utc())};

    // Called outside the lock so a sink may itself log.
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(g_sink_mu);
        sink = g_sink;
    }
    if (sink) {
        sink(rec);
    } else {
        stderr_sink(rec);
    }
}

} // namespace log
} // namespace consent
