#ifndef LENDPOOL_MATH_HPP
#define LENDPOOL_MATH_HPP

#include <string>

#include "types.hpp"

namespace lendpool {

// =============================================================================
// Wide Integer Helpers
// =============================================================================
//
// Products of two 128-bit values are formed in U256, products involving a
// 256-bit collateral value in U512. Narrowing back always checks range and
// throws ArithmeticOverflowError instead of wrapping.

namespace wide {

U256 widen(U128 v);

// Throws ArithmeticOverflowError if v does not fit 128 bits
U128 narrow(const U256& v, const char* what);

// Throws ArithmeticOverflowError if v does not fit 256 bits
U256 narrow256(const U512& v, const char* what);

U256 pow10(uint32_t exponent);

// Checked 128-bit add/sub
U128 add(U128 a, U128 b, const char* what);
U128 sub(U128 a, U128 b, const char* what);

std::string to_string(U128 v);

// Decimal digits only; throws ConfigurationError on bad input or overflow
U128 parse_u128(const std::string& s);

} // namespace wide

} // namespace lendpool

#endif // LENDPOOL_MATH_HPP
