// =============================================================================
// errors.cpp - Error kind names
// =============================================================================

#include "lendpool/errors.hpp"

namespace lendpool {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION:            return "configuration";
        case ErrorKind::ORACLE:                   return "oracle";
        case ErrorKind::INSOLVENCY:               return "insolvency";
        case ErrorKind::ARITHMETIC_OVERFLOW:      return "arithmetic_overflow";
        case ErrorKind::LIQUIDATION_NOT_ELIGIBLE: return "liquidation_not_eligible";
        case ErrorKind::INSUFFICIENT_BALANCE:     return "insufficient_balance";
        case ErrorKind::PAST_MATURITY:            return "past_maturity";
    }
    return "unknown";
}

} // namespace lendpool
