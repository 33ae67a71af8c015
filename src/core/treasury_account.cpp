#include "treasury_account.hpp"

namespace vault_ledger {

VaultError TreasuryAccount::credit(Amount amount) {
    auto balance = fixed::checked_add(state_.idle_balance, amount);
    auto inflows = fixed::checked_add(state_.lifetime_inflows, amount);
    if (!balance || !inflows) return VaultError::MATH_OVERFLOW;
    state_.idle_balance = *balance;
    state_.lifetime_inflows = *inflows;
    return VaultError::OK;
}

VaultError TreasuryAccount::debit(Amount amount) {
    if (amount > state_.idle_balance) return VaultError::INSUFFICIENT_LIQUIDITY;
    auto outflows = fixed::checked_add(state_.lifetime_outflows, amount);
    if (!outflows) return VaultError::MATH_OVERFLOW;
    state_.idle_balance -= amount;
    state_.lifetime_outflows = *outflows;
    return VaultError::OK;
}

} // namespace vault_ledger
