#ifndef LENDPOOL_ERRORS_HPP
#define LENDPOOL_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lendpool {

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t CONFIGURATION = -1;
constexpr int32_t ORACLE = -20;
constexpr int32_t INSOLVENT = -11;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t ARITHMETIC_OVERFLOW = -12;
constexpr int32_t NOT_LIQUIDATABLE = -15;
constexpr int32_t PAST_MATURITY = -16;
}

enum class ErrorKind : uint8_t {
    CONFIGURATION = 0,
    ORACLE = 1,
    INSOLVENCY = 2,
    ARITHMETIC_OVERFLOW = 3,
    LIQUIDATION_NOT_ELIGIBLE = 4,
    INSUFFICIENT_BALANCE = 5,
    PAST_MATURITY = 6
};

const char* to_string(ErrorKind kind);

// =============================================================================
// Exceptions
// =============================================================================

// Base for every rejection raised by the pool. A thrown action leaves the
// pool exactly as it was before the call.
class PoolError : public std::runtime_error {
public:
    PoolError(ErrorKind kind, int32_t code, const std::string& msg)
        : std::runtime_error(msg), kind_(kind), code_(code) {}

    ErrorKind kind() const noexcept { return kind_; }
    int32_t code() const noexcept { return code_; }

    // Only oracle failures can succeed when resubmitted unchanged
    bool retryable() const noexcept { return kind_ == ErrorKind::ORACLE; }

private:
    ErrorKind kind_;
    int32_t code_;
};

class ConfigurationError : public PoolError {
public:
    explicit ConfigurationError(const std::string& msg)
        : PoolError(ErrorKind::CONFIGURATION, errors::CONFIGURATION, msg) {}
};

class OracleError : public PoolError {
public:
    explicit OracleError(const std::string& msg)
        : PoolError(ErrorKind::ORACLE, errors::ORACLE, msg) {}
};

class InsolvencyError : public PoolError {
public:
    explicit InsolvencyError(const std::string& msg)
        : PoolError(ErrorKind::INSOLVENCY, errors::INSOLVENT, msg) {}
};

class ArithmeticOverflowError : public PoolError {
public:
    explicit ArithmeticOverflowError(const std::string& msg)
        : PoolError(ErrorKind::ARITHMETIC_OVERFLOW, errors::ARITHMETIC_OVERFLOW, msg) {}
};

class LiquidationNotEligibleError : public PoolError {
public:
    explicit LiquidationNotEligibleError(const std::string& msg)
        : PoolError(ErrorKind::LIQUIDATION_NOT_ELIGIBLE, errors::NOT_LIQUIDATABLE, msg) {}
};

class InsufficientBalanceError : public PoolError {
public:
    explicit InsufficientBalanceError(const std::string& msg)
        : PoolError(ErrorKind::INSUFFICIENT_BALANCE, errors::INSUFFICIENT_BALANCE, msg) {}
};

class PastMaturityError : public PoolError {
public:
    explicit PastMaturityError(const std::string& msg)
        : PoolError(ErrorKind::PAST_MATURITY, errors::PAST_MATURITY, msg) {}
};

} // namespace lendpool

#endif // LENDPOOL_ERRORS_HPP
