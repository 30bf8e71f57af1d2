// =============================================================================
// log.cpp - Level-gated diagnostics on stderr
// =============================================================================

#include "lendpool/log.hpp"
#include "lendpool/errors.hpp"

#include <atomic>
#include <iostream>

namespace lendpool {
namespace log {

namespace {
std::atomic<uint8_t> g_level{static_cast<uint8_t>(Level::INFO)};
}

void set_level(Level level) {
    g_level.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

Level parse_level(std::string_view name) {
    if (name == "debug") return Level::DEBUG;
    if (name == "info") return Level::INFO;
    if (name == "warn") return Level::WARN;
    if (name == "error") return Level::ERROR;
    if (name == "off") return Level::OFF;
    throw ConfigurationError("unknown log level: " + std::string(name));
}

const char* level_name(Level level) {
    switch (level) {
        case Level::DEBUG: return "debug";
        case Level::INFO:  return "info";
        case Level::WARN:  return "warn";
        case Level::ERROR: return "error";
        case Level::OFF:   return "off";
    }
    return "unknown";
}

bool enabled(Level lvl) {
    return lvl != Level::OFF && static_cast<uint8_t>(lvl) >= g_level.load(std::memory_order_relaxed);
}

void write(Level lvl, std::string_view message) {
    if (!enabled(lvl)) return;
    std::cerr << "[" << level_name(lvl) << "] " << message << "\n";
}

} // namespace log
} // namespace lendpool
