// =============================================================================
// types.cpp - Address/amount formatting and error names
// =============================================================================

#include "flash/types.hpp"
#include <algorithm>

namespace flash {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr I128 I128_MAX = static_cast<I128>(~U128(0) >> 1);

}  // namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

Address from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.empty() || hex.size() > 40) {
        throw std::invalid_argument("invalid address: '" + std::string(hex) + "'");
    }

    // Left-pad to 40 nibbles
    std::string digits(40 - hex.size(), '0');
    digits.append(hex);

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(digits[2 * i]);
        int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid address: '" + std::string(hex) + "'");
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // namespace addresses

// =============================================================================
// Amounts
// =============================================================================

std::string to_string(I128 value) {
    if (value == 0) return "0";

    bool negative = value < 0;
    // Work in unsigned space so that the minimum value negates cleanly
    U128 magnitude = negative ? U128(0) - static_cast<U128>(value) : static_cast<U128>(value);

    std::string out;
    while (magnitude > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(magnitude % 10)));
        magnitude /= 10;
    }
    if (negative) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

I128 parse_i128(std::string_view text) {
    std::string original{text};
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        text.remove_prefix(1);
    }
    if (text.empty()) {
        throw std::invalid_argument("invalid amount: '" + original + "'");
    }

    // Accumulate the magnitude; the bound allows exactly |I128 min|
    const U128 limit = static_cast<U128>(I128_MAX) + (negative ? 1 : 0);
    U128 magnitude = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid amount: '" + original + "'");
        }
        U128 digit = static_cast<U128>(c - '0');
        if (magnitude > (limit - digit) / 10) {
            throw std::out_of_range("amount out of range: '" + original + "'");
        }
        magnitude = magnitude * 10 + digit;
    }

    if (!negative) return static_cast<I128>(magnitude);
    if (magnitude == static_cast<U128>(I128_MAX) + 1) return -I128_MAX - 1;
    return -static_cast<I128>(magnitude);
}

// =============================================================================
// Error Names
// =============================================================================

namespace errors {

const char* name(int32_t code) {
    switch (code) {
        case OK:                   return "OK";
        case UNSETTLED_BALANCE:    return "UnsettledBalance";
        case NO_ACTIVE_LOCK:       return "NoActiveLock";
        case INSUFFICIENT_RESERVE: return "InsufficientReserve";
        case INVALID_NESTING:      return "InvalidNesting";
        case DELTA_OVERFLOW:       return "DeltaOverflow";
        case LOCK_DEPTH_EXCEEDED:  return "LockDepthExceeded";
        case INVALID_AMOUNT:       return "InvalidAmount";
        case INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case INVALID_CONFIG:       return "InvalidConfig";
        case INVALID_SCENARIO:     return "InvalidScenario";
        case INTERNAL:             return "Internal";
        default:                   return "Unknown";
    }
}

} // namespace errors

} // namespace flash
