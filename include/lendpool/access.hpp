#ifndef LENDPOOL_ACCESS_HPP
#define LENDPOOL_ACCESS_HPP

#include <optional>
#include <set>

#include "types.hpp"

namespace lendpool {

// =============================================================================
// AccessPolicy - optional allow-lists checked before any pool arithmetic
// =============================================================================
//
// An absent list admits everyone. A present list (even an empty one) admits
// only its members.

class AccessPolicy {
public:
    AccessPolicy() = default;
    AccessPolicy(std::optional<std::set<Address>> approved_borrowers,
                 std::optional<std::set<Address>> approved_lenders);

    bool borrower_allowed(const Address& who) const;
    bool lender_allowed(const Address& who) const;

    // Throw ConfigurationError for identities outside a configured list
    void require_borrower(const Address& who) const;
    void require_lender(const Address& who) const;

    bool borrowers_restricted() const { return approved_borrowers_.has_value(); }
    bool lenders_restricted() const { return approved_lenders_.has_value(); }

private:
    std::optional<std::set<Address>> approved_borrowers_;
    std::optional<std::set<Address>> approved_lenders_;
};

} // namespace lendpool

#endif // LENDPOOL_ACCESS_HPP
