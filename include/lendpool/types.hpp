#ifndef LENDPOOL_TYPES_HPP
#define LENDPOOL_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

namespace lendpool {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// Helper to create an address whose last two bytes carry a numeric id
constexpr Address address_from_id(uint16_t id) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts with or without "0x" prefix; throws ConfigurationError on bad input
Address address_from_hex(const std::string& hex);

// =============================================================================
// Fixed-Width Integers
// =============================================================================

using U128 = unsigned __int128;
using U256 = boost::multiprecision::uint256_t;
using U512 = boost::multiprecision::uint512_t;

constexpr U128 U128_MAX = ~static_cast<U128>(0);

// =============================================================================
// Precisions
// =============================================================================

namespace precision {
constexpr uint64_t LTV = 100000;                        // 1e5, max_ltv
constexpr uint64_t LIQUIDATION = 100000;                // 1e5, liquidation_fee
constexpr uint64_t FEE = 100000;                        // 1e5, fee_to_protocol_rate
constexpr uint64_t UTILIZATION = 100000;                // 1e5, linear curve utilization
constexpr uint64_t RATE = 1000000000000000000ULL;       // 1e18, rate_per_sec
constexpr uint64_t EXCHANGE = 1000000000000000000ULL;   // 1e18, exchange_rate
constexpr uint64_t DECAY_SCALE = 1000000000000000000ULL; // 1e18, delta utilization
}

// Per-second rates at 1e18 precision
namespace rates {
constexpr uint64_t DEFAULT_RATE_PER_SEC = 158049988;    // ~0.5% APR
constexpr uint64_t MIN_VARIABLE_RATE = 79123523;        // ~0.25% APR
constexpr uint64_t MAX_VARIABLE_RATE = 146248508681;    // ~10000% APR
}

} // namespace lendpool

#endif // LENDPOOL_TYPES_HPP
