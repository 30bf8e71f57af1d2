// =============================================================================
// math.cpp - Wide integer helpers and address formatting
// =============================================================================

#include "lendpool/math.hpp"
#include "lendpool/errors.hpp"

#include <algorithm>

namespace lendpool {

namespace {

const U256 U128_LIMIT = (U256(1) << 128) - 1;
const U256 U64_LIMIT = (U256(1) << 64) - 1;
const U512 U256_LIMIT = (U512(1) << 256) - 1;

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Addresses
// =============================================================================

std::string to_hex(const Address& addr) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address address_from_hex(const std::string& hex) {
    std::string body = hex;
    if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
        body = body.substr(2);
    }
    if (body.size() != 40) {
        throw ConfigurationError("address must have 40 hex digits: " + hex);
    }

    Address addr = {};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(body[2 * i]);
        int lo = hex_value(body[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw ConfigurationError("invalid hex digit in address: " + hex);
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

namespace wide {

U256 widen(U128 v) {
    U256 r = static_cast<uint64_t>(v >> 64);
    r <<= 64;
    r |= static_cast<uint64_t>(v);
    return r;
}

U128 narrow(const U256& v, const char* what) {
    if (v > U128_LIMIT) {
        throw ArithmeticOverflowError(std::string(what) + " exceeds 128 bits");
    }
    U128 hi = static_cast<uint64_t>(v >> 64);
    U128 lo = static_cast<uint64_t>(v & U64_LIMIT);
    return (hi << 64) | lo;
}

U256 narrow256(const U512& v, const char* what) {
    if (v > U256_LIMIT) {
        throw ArithmeticOverflowError(std::string(what) + " exceeds 256 bits");
    }
    return static_cast<U256>(v);
}

U256 pow10(uint32_t exponent) {
    U256 r = 1;
    for (uint32_t i = 0; i < exponent; ++i) r *= 10;
    return r;
}

U128 add(U128 a, U128 b, const char* what) {
    if (U128_MAX - a < b) {
        throw ArithmeticOverflowError(std::string(what) + " exceeds 128 bits");
    }
    return a + b;
}

U128 sub(U128 a, U128 b, const char* what) {
    if (b > a) {
        throw ArithmeticOverflowError(std::string(what) + " underflows");
    }
    return a - b;
}

std::string to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 parse_u128(const std::string& s) {
    if (s.empty()) {
        throw ConfigurationError("empty integer string");
    }
    U128 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            throw ConfigurationError("invalid integer string: " + s);
        }
        U128 digit = static_cast<U128>(c - '0');
        if (v > (U128_MAX - digit) / 10) {
            throw ConfigurationError("integer exceeds 128 bits: " + s);
        }
        v = v * 10 + digit;
    }
    return v;
}

} // namespace wide

} // namespace lendpool
