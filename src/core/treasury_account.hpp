#pragma once

#include <string>
#include "errors.hpp"
#include "fixed_point.hpp"

namespace vault_ledger {

struct TreasuryState {
    Amount idle_balance{0};
    Amount lifetime_inflows{0};
    Amount lifetime_outflows{0};

    bool operator==(const TreasuryState& o) const {
        return idle_balance == o.idle_balance &&
               lifetime_inflows == o.lifetime_inflows &&
               lifetime_outflows == o.lifetime_outflows;
    }
};

/**
 * Custodial balance of idle (undeployed) pooled funds.
 * credit()/debit() leave the state untouched when they fail.
 */
class TreasuryAccount {
public:
    TreasuryAccount() = default;
    explicit TreasuryAccount(const TreasuryState& state) : state_(state) {}

    Amount balance() const { return state_.idle_balance; }
    const TreasuryState& state() const { return state_; }

    VaultError credit(Amount amount);
    VaultError debit(Amount amount);

    // Idle funds not earmarked for the fee recipient.
    Amount available(Amount reserved_fees) const {
        return fixed::saturating_sub(state_.idle_balance, reserved_fees);
    }

private:
    TreasuryState state_;
};

} // namespace vault_ledger
