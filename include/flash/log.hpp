#ifndef FLASH_LOG_HPP
#define FLASH_LOG_HPP

#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace flash {
namespace log {

enum class Level : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

void set_level(Level level);
Level level();
bool enabled(Level level);

// "trace" | "debug" | "info" | "warn" | "error" | "off"; throws ConfigError
Level parse_level(std::string_view name);
const char* level_name(Level level);

// Redirect output (defaults to std::cerr). Passing nullptr restores std::cerr.
void set_sink(std::ostream* sink);

void write(Level level, std::string_view component, const std::string& message);

} // namespace log
} // namespace flash

// Message is only formatted when the level is enabled
#define FLASH_LOG(level, component, expr)                                   \
    do {                                                                    \
        if (::flash::log::enabled(level)) {                                 \
            std::ostringstream flash_log_stream_;                           \
            flash_log_stream_ << expr;                                      \
            ::flash::log::write(level, component, flash_log_stream_.str()); \
        }                                                                   \
    } while (0)

#define FLASH_LOG_DEBUG(component, expr) FLASH_LOG(::flash::log::Level::DEBUG, component, expr)
#define FLASH_LOG_INFO(component, expr) FLASH_LOG(::flash::log::Level::INFO, component, expr)
#define FLASH_LOG_WARN(component, expr) FLASH_LOG(::flash::log::Level::WARN, component, expr)

#endif // FLASH_LOG_HPP
