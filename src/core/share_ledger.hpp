#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <optional>
#include "errors.hpp"
#include "fixed_point.hpp"

namespace vault_ledger {

struct UserPosition {
    std::string owner;
    Shares shares{0};
    Amount deposited_amount{0};
    Amount withdrawn_amount{0};
    Amount high_water_mark{0};
    UnixSeconds created_at{0};

    bool closed() const { return shares == 0; }

    bool operator==(const UserPosition& o) const {
        return owner == o.owner && shares == o.shares &&
               deposited_amount == o.deposited_amount &&
               withdrawn_amount == o.withdrawn_amount &&
               high_water_mark == o.high_water_mark &&
               created_at == o.created_at;
    }
};

/**
 * Aggregates the NAV depends on, sampled before the operation applies.
 */
struct NavInputs {
    Amount idle_balance{0};
    Amount deployed_current_value{0};
    Amount accumulated_fees{0};
    Shares total_shares{0};
};

namespace nav {

// idle + deployed value - accumulated fees
Result<Amount> distributable_pool(const NavInputs& in);

// Shares minted for a deposit priced at the pre-deposit NAV (1:1 when no shares exist).
Result<Shares> shares_for_deposit(Amount amount, const NavInputs& in);

// floor(shares * pool / total_shares); UNDEFINED_NAV when no shares exist.
Result<Amount> value_of_shares(Shares shares, const NavInputs& in);

// Shares burned to pay out `amount`, rounded up.
Result<Shares> shares_for_amount(Amount amount, const NavInputs& in);

// NAV per share scaled by AMOUNT_SCALE; AMOUNT_SCALE (1.0) when no shares exist.
Result<Amount> nav_per_share(const NavInputs& in);

} // namespace nav

/**
 * Per-principal share balances.
 */
class ShareLedger {
public:
    using PositionMap = std::unordered_map<std::string, UserPosition>;

    ShareLedger() = default;

    bool contains(const std::string& owner) const;
    std::optional<UserPosition> find(const std::string& owner) const;
    void upsert(const UserPosition& position);

    const PositionMap& positions() const { return positions_; }
    std::vector<UserPosition> list() const;
    size_t size() const { return positions_.size(); }

    // Sum of all position shares; nullopt if it does not fit 64 bits.
    std::optional<Shares> sum_shares() const;

    void restore(PositionMap positions) { positions_ = std::move(positions); }

    // Position-level bookkeeping used by the engine on staged copies.
    static VaultError apply_mint(UserPosition& pos, Shares minted, Amount deposited);
    static VaultError apply_burn(UserPosition& pos, Shares burned, Amount paid_out);

private:
    PositionMap positions_;
};

} // namespace vault_ledger
