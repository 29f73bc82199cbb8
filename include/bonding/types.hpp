#ifndef BONDING_TYPES_HPP
#define BONDING_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <optional>
#include <functional>

namespace bonding {

// =============================================================================
// Account Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Helper to create a short test/simulation address: 0x00..00NNNN
constexpr Address from_id(uint16_t id) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Parse "0x" + 40 hex digits. Returns nullopt on malformed input.
std::optional<Address> from_hex(std::string_view hex);

// Lowercase "0x"-prefixed hex
std::string to_hex(const Address& addr);

// Hash for unordered containers
struct Hash {
    size_t operator()(const Address& addr) const {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using X18 = __int128;  // 128-bit for X18 arithmetic
using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18

namespace x18 {

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline int64_t to_int(I128 v) {
    return static_cast<int64_t>(v / X18_ONE);
}

inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

} // namespace x18

// =============================================================================
// Time
// =============================================================================

// Source of "now" in unix seconds; injectable for simulation and tests
using Clock = std::function<uint64_t()>;

uint64_t system_seconds();

// =============================================================================
// Wide Arithmetic
// =============================================================================

namespace math {

// floor(a * b / denom) with a 256-bit intermediate product.
// Operands must be non-negative and denom positive; returns nullopt when the
// quotient does not fit in 127 bits or the inputs are out of domain.
std::optional<I128> mul_div(I128 a, I128 b, I128 denom);

// Same as mul_div, rounding up.
std::optional<I128> mul_div_up(I128 a, I128 b, I128 denom);

// 10^exp for exp in [0, 38]
I128 pow10(uint32_t exp);

} // namespace math

// =============================================================================
// Decimal Amount Strings
// =============================================================================

namespace units {

// Parse a non-negative decimal string ("1", "0.25", "800000000") into an
// integer scaled by 10^decimals. Excess fractional digits are rejected.
std::optional<I128> parse(std::string_view text, uint32_t decimals = 18);

// Render a scaled integer as a decimal string, trimming trailing zeros.
std::string format(I128 value, uint32_t decimals = 18);

// Plain base-10 rendering of a 128-bit integer
std::string to_string(I128 value);

} // namespace units

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Input validation
constexpr int32_t ZERO_INPUT = -1;
constexpr int32_t EMPTY_INPUT = -2;
constexpr int32_t SUPPLY_EXHAUSTED = -3;
constexpr int32_t INSUFFICIENT_INVENTORY = -4;
constexpr int32_t NO_INVENTORY_SOLD = -5;
constexpr int32_t INSUFFICIENT_RESERVE = -6;
constexpr int32_t SLIPPAGE_EXCEEDED = -7;
constexpr int32_t ARITHMETIC_OVERFLOW = -8;
constexpr int32_t INVALID_CONFIG = -9;

// Downstream transfers
constexpr int32_t LEDGER_TRANSFER_FAILED = -10;
constexpr int32_t FEE_TRANSFER_FAILED = -11;
constexpr int32_t SETTLEMENT_TRANSFER_FAILED = -12;

// Oracle
constexpr int32_t ORACLE_SOURCE_UNAVAILABLE = -21;
constexpr int32_t INVALID_PRICE = -22;

// Execution
constexpr int32_t REENTRANCY = -30;

// Liquidity deployment
constexpr int32_t INSUFFICIENT_RESERVE_FOR_DEPLOYMENT = -35;
constexpr int32_t LIQUIDITY_SINK_FAILED = -36;

constexpr int32_t UNAUTHORIZED = -40;
} // namespace errors

enum class ErrorKind : uint8_t {
    NONE = 0,
    INPUT_VALIDATION = 1,
    ORACLE_FAULT = 2,
    DOWNSTREAM_TRANSFER = 3,
    REENTRANCY = 4,
    DEPLOYMENT_SHORTFALL = 5,
    AUTHORIZATION = 6
};

// Which failure category a status code belongs to
ErrorKind error_kind(int32_t code);

// Stable identifier for a status code ("INSUFFICIENT_INVENTORY")
const char* error_name(int32_t code);

} // namespace bonding

#endif // BONDING_TYPES_HPP
