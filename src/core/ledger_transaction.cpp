#include "ledger_transaction.hpp"
#include <spdlog/spdlog.h>

namespace vault_ledger {

LedgerTransaction::LedgerTransaction(const ConfigStore& config,
                                     const TreasuryAccount& treasury,
                                     const ShareLedger& ledger)
    : base_config_(config.get())
    , base_ledger_(ledger)
    , config_(config.get())
    , treasury_(treasury) {}

UserPosition* LedgerTransaction::position(const std::string& owner) {
    auto it = staged_.find(owner);
    if (it != staged_.end()) return &it->second;
    auto committed = base_ledger_.find(owner);
    if (!committed) return nullptr;
    auto res = staged_.emplace(owner, *committed);
    return &res.first->second;
}

UserPosition& LedgerTransaction::create_position(const std::string& owner, UnixSeconds now) {
    UserPosition pos;
    pos.owner = owner;
    pos.created_at = now;
    auto& slot = staged_[owner];
    slot = pos;
    return slot;
}

NavInputs LedgerTransaction::nav_inputs() const {
    NavInputs in;
    in.idle_balance = treasury_.balance();
    in.deployed_current_value = config_.deployed_current_value;
    in.accumulated_fees = config_.accumulated_fees;
    in.total_shares = config_.total_shares;
    return in;
}

void LedgerTransaction::emit(LedgerEventType type, LedgerEventPayload payload) {
    events_.emplace_back(type, std::move(payload));
}

VaultError LedgerTransaction::verify() const {
    if (config_.performance_fee_bps > BPS_DENOMINATOR || config_.max_deployment_bps > BPS_DENOMINATOR) {
        spdlog::error("Invariant: fee bps {} / deployment bps {} out of range",
                      config_.performance_fee_bps, config_.max_deployment_bps);
        return VaultError::INVARIANT_VIOLATION;
    }
    if (config_.last_valuation_timestamp < base_config_.last_valuation_timestamp) {
        spdlog::error("Invariant: valuation timestamp moved backwards {} -> {}",
                      base_config_.last_valuation_timestamp, config_.last_valuation_timestamp);
        return VaultError::INVARIANT_VIOLATION;
    }

    // Net share movement over touched positions must match the aggregate.
    __int128 position_delta = 0;
    for (const auto& kv : staged_) {
        auto before = base_ledger_.find(kv.first);
        __int128 old_shares = before ? static_cast<__int128>(before->shares) : 0;
        position_delta += static_cast<__int128>(kv.second.shares) - old_shares;
    }
    __int128 total_delta = static_cast<__int128>(config_.total_shares) -
                           static_cast<__int128>(base_config_.total_shares);
    if (position_delta != total_delta) {
        spdlog::error("Invariant: total_shares moved by {} but positions moved by {}",
                      static_cast<int64_t>(total_delta), static_cast<int64_t>(position_delta));
        return VaultError::INVARIANT_VIOLATION;
    }

    auto total_value = fixed::checked_add(treasury_.balance(), config_.deployed_current_value);
    if (!total_value || *total_value < config_.accumulated_fees) {
        spdlog::error("Invariant: accumulated fees {} exceed pooled value", config_.accumulated_fees);
        return VaultError::INVARIANT_VIOLATION;
    }
    return VaultError::OK;
}

void LedgerTransaction::commit(ConfigStore& config, TreasuryAccount& treasury, ShareLedger& ledger) const {
    config.replace(config_);
    treasury = treasury_;
    for (const auto& kv : staged_) {
        ledger.upsert(kv.second);
    }
}

} // namespace vault_ledger
