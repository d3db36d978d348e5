#ifndef FLASH_TYPES_HPP
#define FLASH_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <stdexcept>
#include <vector>

namespace flash {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Default settlement manager address (LP-9014, the flash accounting precompile)
constexpr Address FLASH_MANAGER = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x90,0x14};

// Helper to create address from LP number
constexpr Address from_lp(uint16_t lp_num) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((lp_num >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(lp_num & 0xFF);
    return addr;
}

// Parse "0x" + 40 hex digits. Shorter inputs are left-padded with zeros.
Address from_hex(std::string_view hex);

// Lowercase "0x"-prefixed, always 40 digits
std::string to_hex(const Address& addr);

} // namespace addresses

// =============================================================================
// Amounts
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

std::string to_string(I128 value);

// Parses an optionally signed decimal integer; throws std::invalid_argument
// on malformed input and std::out_of_range when it does not fit in I128.
I128 parse_i128(std::string_view text);

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool is_native() const {
        for (auto b : addr) if (b != 0) return false;
        return true;
    }

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// Native token (address(0))
inline const Currency NATIVE{};

// =============================================================================
// Lock Types
// =============================================================================

using ParticipantId = Address;
using LockIndex = uint64_t;
using Bytes = std::vector<uint8_t>;

struct LockRecord {
    ParticipantId owner;
    LockIndex parent_index;  // Cursor at creation time, 0 for the outermost lock

    bool operator==(const LockRecord& other) const {
        return owner == other.owner && parent_index == other.parent_index;
    }
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t UNSETTLED_BALANCE = -1;
constexpr int32_t NO_ACTIVE_LOCK = -2;
constexpr int32_t INSUFFICIENT_RESERVE = -3;
constexpr int32_t INVALID_NESTING = -4;
constexpr int32_t DELTA_OVERFLOW = -5;
constexpr int32_t LOCK_DEPTH_EXCEEDED = -6;
constexpr int32_t INVALID_AMOUNT = -7;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INVALID_CONFIG = -20;
constexpr int32_t INVALID_SCENARIO = -21;
constexpr int32_t INTERNAL = -99;

const char* name(int32_t code);
}

// =============================================================================
// Exceptions
// =============================================================================

class FlashError : public std::runtime_error {
public:
    FlashError(int32_t code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

// Outermost release attempted while some delta is non-zero
class UnsettledBalance : public FlashError {
public:
    explicit UnsettledBalance(const std::string& msg)
        : FlashError(errors::UNSETTLED_BALANCE, msg) {}
};

// Settlement primitive or cursor query with no lock open
class NoActiveLock : public FlashError {
public:
    explicit NoActiveLock(const std::string& msg)
        : FlashError(errors::NO_ACTIVE_LOCK, msg) {}
};

class InsufficientReserve : public FlashError {
public:
    explicit InsufficientReserve(const std::string& msg)
        : FlashError(errors::INSUFFICIENT_RESERVE, msg) {}
};

// Internal consistency failure in the lock stack
class InvalidNesting : public FlashError {
public:
    explicit InvalidNesting(const std::string& msg)
        : FlashError(errors::INVALID_NESTING, msg) {}
};

class DeltaOverflow : public FlashError {
public:
    explicit DeltaOverflow(const std::string& msg)
        : FlashError(errors::DELTA_OVERFLOW, msg) {}
};

class LockDepthExceeded : public FlashError {
public:
    explicit LockDepthExceeded(const std::string& msg)
        : FlashError(errors::LOCK_DEPTH_EXCEEDED, msg) {}
};

class InvalidAmount : public FlashError {
public:
    explicit InvalidAmount(const std::string& msg)
        : FlashError(errors::INVALID_AMOUNT, msg) {}
};

class InsufficientBalance : public FlashError {
public:
    explicit InsufficientBalance(const std::string& msg)
        : FlashError(errors::INSUFFICIENT_BALANCE, msg) {}
};

class ConfigError : public FlashError {
public:
    explicit ConfigError(const std::string& msg)
        : FlashError(errors::INVALID_CONFIG, msg) {}
};

class ScenarioError : public FlashError {
public:
    explicit ScenarioError(const std::string& msg)
        : FlashError(errors::INVALID_SCENARIO, msg) {}
};

} // namespace flash

#endif // FLASH_TYPES_HPP
