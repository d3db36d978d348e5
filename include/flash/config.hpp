#ifndef FLASH_CONFIG_HPP
#define FLASH_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace flash {

// =============================================================================
// Config - Manager settings loaded from JSON (missing keys keep defaults)
// =============================================================================

struct Config {
    std::string log_level = "info";
    uint32_t max_lock_depth = 0;  // 0 = unlimited
    Address manager_address = addresses::FLASH_MANAGER;

    // Throws ConfigError on unreadable files, bad JSON or invalid values
    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    // Push log_level into the global logger
    void apply_logging() const;
};

} // namespace flash

#endif // FLASH_CONFIG_HPP
