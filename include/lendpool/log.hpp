#ifndef LENDPOOL_LOG_HPP
#define LENDPOOL_LOG_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace lendpool {
namespace log {

enum class Level : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    OFF = 4
};

// Process-wide threshold; defaults to INFO
void set_level(Level level);
Level level();

// "debug", "info", "warn", "error", "off"; throws ConfigurationError otherwise
Level parse_level(std::string_view name);
const char* level_name(Level level);

bool enabled(Level level);

// Writes "[level] message" to std::cerr when enabled
void write(Level level, std::string_view message);

inline void debug(std::string_view message) { write(Level::DEBUG, message); }
inline void info(std::string_view message) { write(Level::INFO, message); }
inline void warn(std::string_view message) { write(Level::WARN, message); }
inline void error(std::string_view message) { write(Level::ERROR, message); }

} // namespace log
} // namespace lendpool

#endif // LENDPOOL_LOG_HPP
