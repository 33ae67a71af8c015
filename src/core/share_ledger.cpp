#include "share_ledger.hpp"
#include <algorithm>

namespace vault_ledger {

namespace nav {

Result<Amount> distributable_pool(const NavInputs& in) {
    auto total_value = fixed::checked_add(in.idle_balance, in.deployed_current_value);
    if (!total_value) return VaultError::MATH_OVERFLOW;
    auto pool = fixed::checked_sub(*total_value, in.accumulated_fees);
    if (!pool) return VaultError::MATH_OVERFLOW;
    return *pool;
}

Result<Shares> shares_for_deposit(Amount amount, const NavInputs& in) {
    if (in.total_shares == 0) return Shares{amount};
    auto pool = distributable_pool(in);
    if (!pool) return pool.error();
    // Outstanding shares with nothing backing them: price is undefined.
    if (*pool == 0) return VaultError::UNDEFINED_NAV;
    auto minted = fixed::mul_div_floor(amount, in.total_shares, *pool);
    if (!minted) return VaultError::MATH_OVERFLOW;
    return *minted;
}

Result<Amount> value_of_shares(Shares shares, const NavInputs& in) {
    if (in.total_shares == 0) return VaultError::UNDEFINED_NAV;
    auto pool = distributable_pool(in);
    if (!pool) return pool.error();
    auto value = fixed::mul_div_floor(shares, *pool, in.total_shares);
    if (!value) return VaultError::MATH_OVERFLOW;
    return *value;
}

Result<Shares> shares_for_amount(Amount amount, const NavInputs& in) {
    if (in.total_shares == 0) return VaultError::UNDEFINED_NAV;
    auto pool = distributable_pool(in);
    if (!pool) return pool.error();
    if (*pool == 0) return VaultError::UNDEFINED_NAV;
    auto burned = fixed::mul_div_ceil(amount, in.total_shares, *pool);
    if (!burned) return VaultError::MATH_OVERFLOW;
    return *burned;
}

Result<Amount> nav_per_share(const NavInputs& in) {
    if (in.total_shares == 0) return Amount{AMOUNT_SCALE};
    auto pool = distributable_pool(in);
    if (!pool) return pool.error();
    auto scaled = fixed::mul_div_floor(*pool, AMOUNT_SCALE, in.total_shares);
    if (!scaled) return VaultError::MATH_OVERFLOW;
    return *scaled;
}

} // namespace nav

bool ShareLedger::contains(const std::string& owner) const {
    return positions_.find(owner) != positions_.end();
}

std::optional<UserPosition> ShareLedger::find(const std::string& owner) const {
    auto it = positions_.find(owner);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

void ShareLedger::upsert(const UserPosition& position) {
    positions_[position.owner] = position;
}

std::vector<UserPosition> ShareLedger::list() const {
    std::vector<UserPosition> out;
    out.reserve(positions_.size());
    for (const auto& kv : positions_) out.push_back(kv.second);
    std::sort(out.begin(), out.end(), [](const UserPosition& a, const UserPosition& b) {
        return a.owner < b.owner;
    });
    return out;
}

std::optional<Shares> ShareLedger::sum_shares() const {
    Shares total = 0;
    for (const auto& kv : positions_) {
        auto next = fixed::checked_add(total, kv.second.shares);
        if (!next) return std::nullopt;
        total = *next;
    }
    return total;
}

VaultError ShareLedger::apply_mint(UserPosition& pos, Shares minted, Amount deposited) {
    auto shares = fixed::checked_add(pos.shares, minted);
    auto deposited_total = fixed::checked_add(pos.deposited_amount, deposited);
    auto hwm = fixed::checked_add(pos.high_water_mark, deposited);
    if (!shares || !deposited_total || !hwm) return VaultError::MATH_OVERFLOW;
    pos.shares = *shares;
    pos.deposited_amount = *deposited_total;
    pos.high_water_mark = *hwm;
    return VaultError::OK;
}

VaultError ShareLedger::apply_burn(UserPosition& pos, Shares burned, Amount paid_out) {
    if (burned > pos.shares) return VaultError::INSUFFICIENT_SHARES;
    auto withdrawn = fixed::checked_add(pos.withdrawn_amount, paid_out);
    if (!withdrawn) return VaultError::MATH_OVERFLOW;

    Shares remaining = pos.shares - burned;
    // High-water mark shrinks in proportion to the shares left.
    if (pos.shares > 0) {
        auto hwm = fixed::mul_div_floor(pos.high_water_mark, remaining, pos.shares);
        if (!hwm) return VaultError::MATH_OVERFLOW;
        pos.high_water_mark = *hwm;
    } else {
        pos.high_water_mark = 0;
    }
    pos.shares = remaining;
    pos.withdrawn_amount = *withdrawn;
    return VaultError::OK;
}

} // namespace vault_ledger
