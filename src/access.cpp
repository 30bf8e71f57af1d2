// =============================================================================
// access.cpp - Borrower/lender allow-lists
// =============================================================================

#include "lendpool/access.hpp"
#include "lendpool/errors.hpp"

#include <utility>

namespace lendpool {

AccessPolicy::AccessPolicy(std::optional<std::set<Address>> approved_borrowers,
                           std::optional<std::set<Address>> approved_lenders)
    : approved_borrowers_(std::move(approved_borrowers)),
      approved_lenders_(std::move(approved_lenders)) {}

bool AccessPolicy::borrower_allowed(const Address& who) const {
    return !approved_borrowers_ || approved_borrowers_->count(who) > 0;
}

bool AccessPolicy::lender_allowed(const Address& who) const {
    return !approved_lenders_ || approved_lenders_->count(who) > 0;
}

void AccessPolicy::require_borrower(const Address& who) const {
    if (!borrower_allowed(who)) {
        throw ConfigurationError("borrower not approved: " + to_hex(who));
    }
}

void AccessPolicy::require_lender(const Address& who) const {
    if (!lender_allowed(who)) {
        throw ConfigurationError("lender not approved: " + to_hex(who));
    }
}

} // namespace lendpool
