// =============================================================================
// log.cpp - Leveled diagnostics to stderr
// =============================================================================

#include "flash/log.hpp"
#include "flash/types.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace flash {
namespace log {

namespace {

std::atomic<Level> g_level{Level::INFO};
std::ostream* g_sink = nullptr;
std::mutex g_sink_mutex;

}  // namespace

void set_level(Level level) {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() {
    return g_level.load(std::memory_order_relaxed);
}

bool enabled(Level lvl) {
    return lvl != Level::OFF && lvl >= level();
}

Level parse_level(std::string_view name) {
    if (name == "trace") return Level::TRACE;
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn" || name == "warning") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off") return Level::OFF;
    throw ConfigError("unknown log level: '" + std::string(name) + "'");
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::TRACE: return "trace";
        case Level::DEBUG: return "debug";
        case Level::INFO:  return "info";
        case Level::WARN:  return "warn";
        case Level::ERROR: return "error";
        case Level::OFF:   return "off";
    }
    return "unknown";
}

void set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = sink;
}

void write(Level lvl, std::string_view component, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ")
        << " [" << level_name(lvl) << "] " << component << ": " << message << "\n";
}

} // namespace log
} // namespace flash
