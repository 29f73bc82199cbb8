// =============================================================================
// types.cpp - Addresses, 256-bit mul_div, decimal amounts, error tables
// =============================================================================

#include "bonding/types.hpp"

#include <algorithm>
#include <chrono>

namespace bonding {

namespace {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits
};

// Multiply two U128 values to produce U256
inline U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    // Cross products
    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

// Divide U256 by U128 with restoring long division.
// Sets overflow when the quotient does not fit in 128 bits.
inline U128 div_u256_u128(U256 num, U128 denom, U128& rem, bool& overflow) {
    overflow = false;
    if (num.hi == 0) {
        rem = num.lo % denom;
        return num.lo / denom;
    }
    if (num.hi >= denom) {
        overflow = true;
        rem = 0;
        return 0;
    }

    U128 quot = 0;
    rem = num.hi;
    for (int i = 127; i >= 0; --i) {
        bool carry = (rem >> 127) != 0;
        rem = (rem << 1) | ((num.lo >> i) & 1);
        quot <<= 1;
        // With carry set the true remainder is >= 2^128 > denom; the
        // wrapping subtraction still yields the right residue.
        if (carry || rem >= denom) {
            rem -= denom;
            quot |= 1;
        }
    }
    return quot;
}

constexpr I128 I128_MAX = static_cast<I128>((~U128(0)) >> 1);

inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::optional<Address> from_hex(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
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
// Time
// =============================================================================

uint64_t system_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

// =============================================================================
// Wide Arithmetic
// =============================================================================

namespace math {

std::optional<I128> mul_div(I128 a, I128 b, I128 denom) {
    if (a < 0 || b < 0 || denom <= 0) return std::nullopt;

    U256 product = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    U128 rem = 0;
    bool overflow = false;
    U128 quot = div_u256_u128(product, static_cast<U128>(denom), rem, overflow);
    if (overflow || quot > static_cast<U128>(I128_MAX)) return std::nullopt;
    return static_cast<I128>(quot);
}

std::optional<I128> mul_div_up(I128 a, I128 b, I128 denom) {
    if (a < 0 || b < 0 || denom <= 0) return std::nullopt;

    U256 product = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    U128 rem = 0;
    bool overflow = false;
    U128 quot = div_u256_u128(product, static_cast<U128>(denom), rem, overflow);
    if (overflow) return std::nullopt;
    if (rem != 0) ++quot;
    if (quot > static_cast<U128>(I128_MAX)) return std::nullopt;
    return static_cast<I128>(quot);
}

I128 pow10(uint32_t exp) {
    I128 result = 1;
    for (uint32_t i = 0; i < exp && i < 38; ++i) result *= 10;
    return result;
}

} // namespace math

// =============================================================================
// Decimal Amount Strings
// =============================================================================

namespace units {

std::optional<I128> parse(std::string_view text, uint32_t decimals) {
    if (text.empty() || decimals > 36) return std::nullopt;

    I128 whole = 0;
    I128 frac = 0;
    uint32_t frac_digits = 0;
    bool seen_dot = false;
    bool seen_digit = false;

    for (char c : text) {
        if (c == '.') {
            if (seen_dot) return std::nullopt;
            seen_dot = true;
            continue;
        }
        if (c == '_') continue;  // digit separator
        if (c < '0' || c > '9') return std::nullopt;
        seen_digit = true;

        int digit = c - '0';
        if (seen_dot) {
            if (frac_digits == decimals) return std::nullopt;
            frac = frac * 10 + digit;
            ++frac_digits;
        } else {
            if (whole > (I128_MAX - digit) / 10) return std::nullopt;
            whole = whole * 10 + digit;
        }
    }
    if (!seen_digit) return std::nullopt;

    I128 scale = math::pow10(decimals);
    I128 frac_scaled = frac * math::pow10(decimals - frac_digits);
    if (whole > (I128_MAX - frac_scaled) / scale) return std::nullopt;
    return whole * scale + frac_scaled;
}

std::string to_string(I128 value) {
    if (value == 0) return "0";
    bool neg = value < 0;
    U128 v = neg ? static_cast<U128>(-(value + 1)) + 1 : static_cast<U128>(value);
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

std::string format(I128 value, uint32_t decimals) {
    bool neg = value < 0;
    if (neg) value = -value;

    I128 scale = math::pow10(decimals);
    std::string out = to_string(value / scale);
    I128 frac = value % scale;
    if (frac != 0) {
        std::string digits = to_string(frac);
        digits.insert(0, decimals - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        out += "." + digits;
    }
    return neg ? "-" + out : out;
}

} // namespace units

// =============================================================================
// Error Tables
// =============================================================================

ErrorKind error_kind(int32_t code) {
    switch (code) {
        case errors::OK:
            return ErrorKind::NONE;
        case errors::ZERO_INPUT:
        case errors::EMPTY_INPUT:
        case errors::SUPPLY_EXHAUSTED:
        case errors::INSUFFICIENT_INVENTORY:
        case errors::NO_INVENTORY_SOLD:
        case errors::INSUFFICIENT_RESERVE:
        case errors::SLIPPAGE_EXCEEDED:
        case errors::ARITHMETIC_OVERFLOW:
        case errors::INVALID_CONFIG:
            return ErrorKind::INPUT_VALIDATION;
        case errors::ORACLE_SOURCE_UNAVAILABLE:
        case errors::INVALID_PRICE:
            return ErrorKind::ORACLE_FAULT;
        case errors::LEDGER_TRANSFER_FAILED:
        case errors::FEE_TRANSFER_FAILED:
        case errors::SETTLEMENT_TRANSFER_FAILED:
        case errors::LIQUIDITY_SINK_FAILED:
            return ErrorKind::DOWNSTREAM_TRANSFER;
        case errors::REENTRANCY:
            return ErrorKind::REENTRANCY;
        case errors::INSUFFICIENT_RESERVE_FOR_DEPLOYMENT:
            return ErrorKind::DEPLOYMENT_SHORTFALL;
        case errors::UNAUTHORIZED:
            return ErrorKind::AUTHORIZATION;
        default:
            return ErrorKind::INPUT_VALIDATION;
    }
}

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::ZERO_INPUT: return "ZERO_INPUT";
        case errors::EMPTY_INPUT: return "EMPTY_INPUT";
        case errors::SUPPLY_EXHAUSTED: return "SUPPLY_EXHAUSTED";
        case errors::INSUFFICIENT_INVENTORY: return "INSUFFICIENT_INVENTORY";
        case errors::NO_INVENTORY_SOLD: return "NO_INVENTORY_SOLD";
        case errors::INSUFFICIENT_RESERVE: return "INSUFFICIENT_RESERVE";
        case errors::SLIPPAGE_EXCEEDED: return "SLIPPAGE_EXCEEDED";
        case errors::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case errors::INVALID_CONFIG: return "INVALID_CONFIG";
        case errors::LEDGER_TRANSFER_FAILED: return "LEDGER_TRANSFER_FAILED";
        case errors::FEE_TRANSFER_FAILED: return "FEE_TRANSFER_FAILED";
        case errors::SETTLEMENT_TRANSFER_FAILED: return "SETTLEMENT_TRANSFER_FAILED";
        case errors::ORACLE_SOURCE_UNAVAILABLE: return "ORACLE_SOURCE_UNAVAILABLE";
        case errors::INVALID_PRICE: return "INVALID_PRICE";
        case errors::REENTRANCY: return "REENTRANCY";
        case errors::INSUFFICIENT_RESERVE_FOR_DEPLOYMENT: return "INSUFFICIENT_RESERVE_FOR_DEPLOYMENT";
        case errors::LIQUIDITY_SINK_FAILED: return "LIQUIDITY_SINK_FAILED";
        case errors::UNAUTHORIZED: return "UNAUTHORIZED";
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace bonding
