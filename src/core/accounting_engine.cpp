#include "accounting_engine.hpp"
#include <spdlog/spdlog.h>

namespace vault_ledger {

namespace {

VaultError reject(const char* op, VaultError err) {
    spdlog::warn("{} rejected: {}", op, to_string(err));
    return err;
}

} // namespace

AccountingEngine::AccountingEngine(std::shared_ptr<LedgerClock> clock, ValuationOracleGate gate)
    : clock_(clock ? std::move(clock) : std::make_shared<LedgerClock>())
    , gate_(gate) {}

VaultError AccountingEngine::require_initialized() const {
    return config_store_.initialized() ? VaultError::OK : VaultError::NOT_INITIALIZED;
}

VaultError AccountingEngine::commit(LedgerTransaction& tx, std::unique_lock<std::mutex>& lock) {
    VaultError verdict = tx.verify();
    if (verdict != VaultError::OK) return verdict;

    tx.commit(config_store_, treasury_, ledger_);
    ++commits_;

    UnixSeconds now = clock_->now_sec();
    std::vector<LedgerEvent> published;
    published.reserve(tx.events().size());
    for (const auto& e : tx.events()) {
        LedgerEvent ev;
        ev.sequence = ++last_sequence_;
        ev.timestamp = now;
        ev.event_type = e.first;
        ev.data = e.second;
        if (journal_) journal_->append(ev);
        published.push_back(std::move(ev));
    }

    CommitHook hook;
    LedgerSnapshot snap;
    if (commit_hook_ && commit_hook_interval_ > 0 && commits_ % commit_hook_interval_ == 0) {
        hook = commit_hook_;
        snap = snapshot_locked();
    }
    lock.unlock();

    if (hook) {
        // Hooks from racing commits may arrive out of order; never hand out an older image.
        std::lock_guard<std::mutex> guard(hook_mutex_);
        if (snap.last_sequence >= last_hooked_sequence_) {
            last_hooked_sequence_ = snap.last_sequence;
            hook(snap);
        }
    }

    std::vector<EventCallback> callbacks_copy;
    {
        std::lock_guard<std::mutex> guard(callbacks_mutex_);
        callbacks_copy = event_callbacks_;
    }
    for (const auto& ev : published) {
        for (auto& cb : callbacks_copy) {
            if (cb) cb(ev);
        }
    }
    return VaultError::OK;
}

Result<ProtocolConfig> AccountingEngine::initialize_protocol(const std::string& caller,
                                                             const InitializeParams& params) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (config_store_.initialized()) return reject("initialize_protocol", VaultError::ALREADY_INITIALIZED);
    if (caller.empty() || caller != params.admin) return reject("initialize_protocol", VaultError::UNAUTHORIZED);

    auto initial = ConfigStore::build_initial(params);
    if (!initial) return reject("initialize_protocol", initial.error());

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    tx.config() = *initial;
    // Fresh treasury: balance starts at zero.
    tx.treasury() = TreasuryAccount{};
    tx.emit(LedgerEventType::PROTOCOL_INITIALIZED,
            ProtocolInitializedData{initial->admin, initial->operator_id, initial->fee_recipient,
                                    initial->performance_fee_bps, initial->max_deployment_bps});
    ProtocolConfig installed = *initial;
    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;

    spdlog::info("Protocol initialized admin={} operator={} fee_bps={} max_deploy_bps={}",
                 installed.admin, installed.operator_id, installed.performance_fee_bps,
                 installed.max_deployment_bps);
    return installed;
}

Result<UserPosition> AccountingEngine::create_user_position(const std::string& owner) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("create_user_position", err);
    if (owner.empty()) return reject("create_user_position", VaultError::INVALID_IDENTITY);
    if (ledger_.contains(owner)) return reject("create_user_position", VaultError::POSITION_EXISTS);

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    UserPosition created = tx.create_position(owner, clock_->now_sec());
    tx.emit(LedgerEventType::POSITION_CREATED, PositionCreatedData{owner});
    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;

    spdlog::info("User position created for {}", owner);
    return created;
}

Result<DepositReceipt> AccountingEngine::deposit(const std::string& owner, Amount amount, Shares min_shares) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("deposit", err);
    const auto& cfg = config_store_.get();
    if (cfg.is_paused) return reject("deposit", VaultError::PAUSED);
    if (owner.empty()) return reject("deposit", VaultError::INVALID_IDENTITY);
    if (amount == 0) return reject("deposit", VaultError::ZERO_AMOUNT);

    LedgerTransaction tx(config_store_, treasury_, ledger_);

    // Priced at the NAV before the deposit lands in the treasury.
    auto minted = nav::shares_for_deposit(amount, tx.nav_inputs());
    if (!minted) return reject("deposit", minted.error());
    if (*minted == 0 || *minted < min_shares) {
        spdlog::warn("deposit rejected: {} shares minted for amount={} (min {})", *minted, amount, min_shares);
        return VaultError::SLIPPAGE_EXCEEDED;
    }

    UserPosition* pos = tx.position(owner);
    if (!pos) {
        pos = &tx.create_position(owner, clock_->now_sec());
        tx.emit(LedgerEventType::POSITION_CREATED, PositionCreatedData{owner});
    }
    if (auto err = ShareLedger::apply_mint(*pos, *minted, amount); err != VaultError::OK) {
        return reject("deposit", err);
    }
    auto total = fixed::checked_add(tx.config().total_shares, *minted);
    if (!total) return reject("deposit", VaultError::MATH_OVERFLOW);
    tx.config().total_shares = *total;
    if (auto err = tx.treasury().credit(amount); err != VaultError::OK) return reject("deposit", err);

    DepositReceipt receipt;
    receipt.owner = owner;
    receipt.amount = amount;
    receipt.shares_minted = *minted;
    receipt.position_shares = pos->shares;
    receipt.total_shares = tx.config().total_shares;
    receipt.treasury_balance = tx.treasury().balance();
    tx.emit(LedgerEventType::DEPOSIT, DepositData{owner, amount, *minted, receipt.treasury_balance});

    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;
    spdlog::info("Deposited {} for {}. Minted {} shares, position shares {}",
                 amount, owner, receipt.shares_minted, receipt.position_shares);
    return receipt;
}

Result<WithdrawReceipt> AccountingEngine::withdraw(const std::string& owner, Shares shares, Amount min_payout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("withdraw", err);
    if (config_store_.get().is_paused) return reject("withdraw", VaultError::PAUSED);
    if (shares == 0) return reject("withdraw", VaultError::ZERO_AMOUNT);

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    UserPosition* pos = tx.position(owner);
    if (!pos) return reject("withdraw", VaultError::POSITION_NOT_FOUND);
    if (shares > pos->shares) return reject("withdraw", VaultError::INSUFFICIENT_SHARES);

    auto payout = nav::value_of_shares(shares, tx.nav_inputs());
    if (!payout) return reject("withdraw", payout.error());
    if (*payout < min_payout) {
        spdlog::warn("withdraw rejected: payout {} below minimum {}", *payout, min_payout);
        return VaultError::SLIPPAGE_EXCEEDED;
    }
    // Never recalls deployed capital; fees stay reserved for the sweep.
    if (*payout > tx.treasury().available(tx.config().accumulated_fees)) {
        spdlog::warn("withdraw rejected: payout {} exceeds available idle {}",
                     *payout, tx.treasury().available(tx.config().accumulated_fees));
        return VaultError::INSUFFICIENT_LIQUIDITY;
    }

    if (auto err = tx.treasury().debit(*payout); err != VaultError::OK) return reject("withdraw", err);
    if (auto err = ShareLedger::apply_burn(*pos, shares, *payout); err != VaultError::OK) {
        return reject("withdraw", err);
    }
    auto total = fixed::checked_sub(tx.config().total_shares, shares);
    if (!total) return reject("withdraw", VaultError::MATH_OVERFLOW);
    tx.config().total_shares = *total;

    WithdrawReceipt receipt;
    receipt.owner = owner;
    receipt.payout = *payout;
    receipt.shares_burned = shares;
    receipt.remaining_shares = pos->shares;
    receipt.treasury_balance = tx.treasury().balance();
    tx.emit(LedgerEventType::WITHDRAW, WithdrawData{owner, *payout, shares, pos->shares});

    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;
    spdlog::info("Withdrew {} for {}. Burned {} shares", receipt.payout, owner, shares);
    return receipt;
}

Result<WithdrawReceipt> AccountingEngine::withdraw_amount(const std::string& owner, Amount amount, Shares max_shares) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("withdraw_amount", err);
    if (config_store_.get().is_paused) return reject("withdraw_amount", VaultError::PAUSED);
    if (amount == 0) return reject("withdraw_amount", VaultError::ZERO_AMOUNT);

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    UserPosition* pos = tx.position(owner);
    if (!pos) return reject("withdraw_amount", VaultError::POSITION_NOT_FOUND);

    auto burned = nav::shares_for_amount(amount, tx.nav_inputs());
    if (!burned) return reject("withdraw_amount", burned.error());
    if (*burned > pos->shares) return reject("withdraw_amount", VaultError::INSUFFICIENT_SHARES);
    if (*burned > max_shares) {
        spdlog::warn("withdraw_amount rejected: {} shares needed, max {}", *burned, max_shares);
        return VaultError::SLIPPAGE_EXCEEDED;
    }
    if (amount > tx.treasury().available(tx.config().accumulated_fees)) {
        return reject("withdraw_amount", VaultError::INSUFFICIENT_LIQUIDITY);
    }

    if (auto err = tx.treasury().debit(amount); err != VaultError::OK) return reject("withdraw_amount", err);
    if (auto err = ShareLedger::apply_burn(*pos, *burned, amount); err != VaultError::OK) {
        return reject("withdraw_amount", err);
    }
    auto total = fixed::checked_sub(tx.config().total_shares, *burned);
    if (!total) return reject("withdraw_amount", VaultError::MATH_OVERFLOW);
    tx.config().total_shares = *total;

    WithdrawReceipt receipt;
    receipt.owner = owner;
    receipt.payout = amount;
    receipt.shares_burned = *burned;
    receipt.remaining_shares = pos->shares;
    receipt.treasury_balance = tx.treasury().balance();
    tx.emit(LedgerEventType::WITHDRAW, WithdrawData{owner, amount, *burned, pos->shares});

    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;
    spdlog::info("Withdrew {} for {}. Burned {} shares", amount, owner, receipt.shares_burned);
    return receipt;
}

Result<DeploymentReceipt> AccountingEngine::deploy_capital_for_trading(const std::string& caller, Amount amount) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("deploy_capital", err);
    if (!config_store_.is_operator(caller)) return reject("deploy_capital", VaultError::UNAUTHORIZED);
    if (config_store_.get().is_paused) return reject("deploy_capital", VaultError::PAUSED);
    if (amount == 0) return reject("deploy_capital", VaultError::ZERO_AMOUNT);

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    auto& cfg = tx.config();

    // deployed + amount <= bps * (idle + deployed), sampled before the move.
    auto pooled = fixed::checked_add(tx.treasury().balance(), cfg.total_trading_deployed);
    auto projected = fixed::checked_add(cfg.total_trading_deployed, amount);
    if (!pooled || !projected) return reject("deploy_capital", VaultError::MATH_OVERFLOW);
    auto ceiling = fixed::bps_of(*pooled, cfg.max_deployment_bps);
    if (!ceiling) return reject("deploy_capital", VaultError::MATH_OVERFLOW);
    if (*projected > *ceiling) {
        spdlog::warn("deploy_capital rejected: deployed {} + {} exceeds ceiling {}",
                     cfg.total_trading_deployed, amount, *ceiling);
        return VaultError::EXCEEDS_DEPLOYMENT_LIMIT;
    }
    if (amount > tx.treasury().available(cfg.accumulated_fees)) {
        return reject("deploy_capital", VaultError::INSUFFICIENT_LIQUIDITY);
    }

    if (auto err = tx.treasury().debit(amount); err != VaultError::OK) return reject("deploy_capital", err);
    auto current = fixed::checked_add(cfg.deployed_current_value, amount);
    if (!current) return reject("deploy_capital", VaultError::MATH_OVERFLOW);
    cfg.total_trading_deployed = *projected;
    cfg.deployed_current_value = *current;
    cfg.last_deployment_timestamp = clock_->now_sec();
    if (cfg.deployment_started_at == 0) cfg.deployment_started_at = cfg.last_deployment_timestamp;

    DeploymentReceipt receipt;
    receipt.amount = amount;
    receipt.total_deployed = cfg.total_trading_deployed;
    receipt.deployed_current_value = cfg.deployed_current_value;
    receipt.treasury_remaining = tx.treasury().balance();
    tx.emit(LedgerEventType::CAPITAL_DEPLOYED,
            CapitalDeployedData{amount, receipt.total_deployed, receipt.treasury_remaining});

    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;
    spdlog::info("Deployed {} for trading. Total deployed {}, treasury remaining {}",
                 amount, receipt.total_deployed, receipt.treasury_remaining);
    return receipt;
}

Result<ReturnReceipt> AccountingEngine::return_capital_from_trading(const std::string& caller,
                                                                   Amount amount_returned,
                                                                   SignedAmount realized_pnl) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("return_capital", err);
    if (!config_store_.is_operator(caller)) return reject("return_capital", VaultError::UNAUTHORIZED);
    if (amount_returned == 0 && realized_pnl == 0) return reject("return_capital", VaultError::ZERO_AMOUNT);

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    auto& cfg = tx.config();

    // Principal = returned - pnl; a loss means more principal than cash came back.
    __int128 principal_wide = static_cast<__int128>(amount_returned) - static_cast<__int128>(realized_pnl);
    if (principal_wide < 0) return reject("return_capital", VaultError::INVALID_AMOUNT);
    if (principal_wide > static_cast<__int128>(cfg.total_trading_deployed)) {
        spdlog::warn("return_capital rejected: principal exceeds deployed {}", cfg.total_trading_deployed);
        return VaultError::RETURN_EXCEEDS_DEPLOYED;
    }
    Amount principal = static_cast<Amount>(principal_wide);

    if (auto err = tx.treasury().credit(amount_returned); err != VaultError::OK) return reject("return_capital", err);
    cfg.total_trading_deployed -= principal;

    Amount fee = 0;
    if (realized_pnl > 0) {
        auto f = fixed::bps_of(static_cast<Amount>(realized_pnl), cfg.performance_fee_bps);
        if (!f) return reject("return_capital", VaultError::MATH_OVERFLOW);
        auto accrued = fixed::checked_add(cfg.accumulated_fees, *f);
        if (!accrued) return reject("return_capital", VaultError::MATH_OVERFLOW);
        fee = *f;
        cfg.accumulated_fees = *accrued;
    }

    // The mark carries principal only; realized PnL reaches NAV through the cash credit.
    cfg.deployed_current_value = fixed::saturating_sub(cfg.deployed_current_value, principal);
    if (cfg.total_trading_deployed == 0) {
        cfg.deployed_current_value = 0;
        cfg.pending_unrealized_fees = 0;
        cfg.deployment_started_at = 0;
    }

    ReturnReceipt receipt;
    receipt.amount_returned = amount_returned;
    receipt.principal_returned = principal;
    receipt.realized_pnl = realized_pnl;
    receipt.fee_accrued = fee;
    receipt.total_deployed = cfg.total_trading_deployed;
    receipt.treasury_balance = tx.treasury().balance();
    tx.emit(LedgerEventType::CAPITAL_RETURNED,
            CapitalReturnedData{amount_returned, realized_pnl, principal, fee, receipt.treasury_balance});

    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;
    if (realized_pnl > 0) {
        spdlog::info("Capital returned {}: profit {}, fee accrued {}", amount_returned, realized_pnl, fee);
    } else if (realized_pnl < 0) {
        spdlog::info("Capital returned {}: loss {}", amount_returned, fixed::abs_of(realized_pnl));
    } else {
        spdlog::info("Capital returned {} at cost", amount_returned);
    }
    return receipt;
}

Result<AdmittedValuation> AccountingEngine::update_deployment_valuation(const std::string& caller,
                                                                       const ValuationReport& report) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("update_valuation", err);
    if (!config_store_.is_operator(caller)) return reject("update_valuation", VaultError::UNAUTHORIZED);

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    auto& cfg = tx.config();
    auto admitted = gate_.admit(report, cfg, tx.treasury().balance(), clock_->now_sec());
    if (!admitted) return reject("update_valuation", admitted.error());

    cfg.deployed_current_value = admitted->deployed_current_value;
    cfg.pending_unrealized_fees = admitted->pending_unrealized_fees;
    cfg.last_valuation_timestamp = admitted->timestamp;

    ValuationUpdatedData record;
    record.deployment_id = report.deployment_id;
    record.total_deployed_original = cfg.total_trading_deployed;
    record.total_deployed_current = cfg.deployed_current_value;
    record.orca_value = report.orca_positions_value;
    record.drift_value = report.drift_equity_value;
    record.uncollected_fees = report.uncollected_fees;
    record.unrealized_pnl = report.unrealized_pnl;
    record.pending_fees = cfg.pending_unrealized_fees;
    record.valuation_timestamp = admitted->timestamp;
    tx.emit(LedgerEventType::VALUATION_UPDATED, record);

    AdmittedValuation out = *admitted;
    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;
    spdlog::info("Valuation updated: deployed original={} current={} pending_fees={} ts={}",
                 record.total_deployed_original, record.total_deployed_current,
                 record.pending_fees, record.valuation_timestamp);
    return out;
}

Result<Amount> AccountingEngine::sweep_fees(const std::string& caller) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("sweep_fees", err);
    if (!config_store_.is_admin(caller)) return reject("sweep_fees", VaultError::UNAUTHORIZED);

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    auto& cfg = tx.config();
    Amount fees = cfg.accumulated_fees;
    if (fees == 0) return reject("sweep_fees", VaultError::NOTHING_TO_SWEEP);
    if (auto err = tx.treasury().debit(fees); err != VaultError::OK) return reject("sweep_fees", err);
    cfg.accumulated_fees = 0;
    cfg.last_fee_sweep = clock_->now_sec();
    tx.emit(LedgerEventType::FEES_SWEPT, FeesSweptData{cfg.fee_recipient, fees});

    std::string recipient = cfg.fee_recipient;
    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;
    spdlog::info("Swept {} in fees to {}", fees, recipient);
    return fees;
}

Result<bool> AccountingEngine::pause_protocol(const std::string& caller) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("pause_protocol", err);
    if (!config_store_.is_admin(caller)) return reject("pause_protocol", VaultError::UNAUTHORIZED);

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    tx.config().is_paused = true;
    tx.emit(LedgerEventType::PAUSE_CHANGED, PauseChangedData{true});
    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;
    spdlog::warn("Protocol paused by {}", caller);
    return true;
}

Result<bool> AccountingEngine::unpause_protocol(const std::string& caller) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return reject("unpause_protocol", err);
    if (!config_store_.is_admin(caller)) return reject("unpause_protocol", VaultError::UNAUTHORIZED);

    LedgerTransaction tx(config_store_, treasury_, ledger_);
    tx.config().is_paused = false;
    tx.emit(LedgerEventType::PAUSE_CHANGED, PauseChangedData{false});
    VaultError err = commit(tx, lock);
    if (err != VaultError::OK) return err;
    spdlog::info("Protocol unpaused by {}", caller);
    return false;
}

Result<BalanceQuote> AccountingEngine::calculate_user_balance(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return err;
    auto pos = ledger_.find(owner);
    if (!pos) return VaultError::POSITION_NOT_FOUND;

    const auto& cfg = config_store_.get();
    NavInputs in{treasury_.balance(), cfg.deployed_current_value, cfg.accumulated_fees, cfg.total_shares};
    auto amount = nav::value_of_shares(pos->shares, in);
    if (!amount) return amount.error();

    auto staleness = gate_.staleness(cfg, clock_->now_sec());
    if (staleness.stale) {
        spdlog::warn("Balance for {} uses a stale valuation ({}s old)", owner, staleness.age_sec);
    }
    BalanceQuote quote;
    quote.amount = *amount;
    quote.stale = staleness.stale;
    quote.valuation_age_sec = staleness.age_sec;
    return quote;
}

Result<ProtocolStats> AccountingEngine::protocol_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return err;
    const auto& cfg = config_store_.get();
    NavInputs in{treasury_.balance(), cfg.deployed_current_value, cfg.accumulated_fees, cfg.total_shares};

    auto tvl = nav::distributable_pool(in);
    if (!tvl) return tvl.error();
    auto price = nav::nav_per_share(in);
    if (!price) return price.error();

    ProtocolStats stats;
    stats.tvl = *tvl;
    stats.idle_balance = treasury_.balance();
    stats.total_trading_deployed = cfg.total_trading_deployed;
    stats.deployed_current_value = cfg.deployed_current_value;
    stats.accumulated_fees = cfg.accumulated_fees;
    stats.pending_unrealized_fees = cfg.pending_unrealized_fees;
    stats.total_shares = cfg.total_shares;
    stats.nav_per_share = *price;
    stats.position_count = ledger_.size();
    stats.paused = cfg.is_paused;
    stats.valuation_stale = gate_.staleness(cfg, clock_->now_sec()).stale;
    stats.last_valuation_timestamp = cfg.last_valuation_timestamp;
    stats.last_fee_sweep = cfg.last_fee_sweep;
    return stats;
}

Result<UserStats> AccountingEngine::user_stats(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto err = require_initialized(); err != VaultError::OK) return err;
    auto pos = ledger_.find(owner);
    if (!pos) return VaultError::POSITION_NOT_FOUND;

    const auto& cfg = config_store_.get();
    UserStats stats;
    stats.owner = owner;
    stats.shares = pos->shares;
    stats.deposited_amount = pos->deposited_amount;
    stats.withdrawn_amount = pos->withdrawn_amount;
    stats.high_water_mark = pos->high_water_mark;
    if (cfg.total_shares > 0) {
        NavInputs in{treasury_.balance(), cfg.deployed_current_value, cfg.accumulated_fees, cfg.total_shares};
        auto balance = nav::value_of_shares(pos->shares, in);
        if (!balance) return balance.error();
        stats.balance = *balance;
    }
    stats.gain_above_high_water_mark = fixed::saturating_sub(stats.balance, stats.high_water_mark);
    return stats;
}

std::optional<UserPosition> AccountingEngine::position(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.find(owner);
}

std::vector<UserPosition> AccountingEngine::positions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.list();
}

ProtocolConfig AccountingEngine::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_store_.get();
}

TreasuryState AccountingEngine::treasury() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return treasury_.state();
}

namespace {

VaultError check_state(const ProtocolConfig& cfg, Amount idle_balance, const ShareLedger& ledger) {
    auto sum = ledger.sum_shares();
    if (!sum || *sum != cfg.total_shares) {
        spdlog::error("Audit: total_shares {} does not match position sum", cfg.total_shares);
        return VaultError::INVARIANT_VIOLATION;
    }
    if (cfg.performance_fee_bps > BPS_DENOMINATOR || cfg.max_deployment_bps > BPS_DENOMINATOR) {
        spdlog::error("Audit: fee bps {} / deployment bps {} out of range",
                      cfg.performance_fee_bps, cfg.max_deployment_bps);
        return VaultError::INVARIANT_VIOLATION;
    }
    auto total_value = fixed::checked_add(idle_balance, cfg.deployed_current_value);
    if (!total_value || *total_value < cfg.accumulated_fees) {
        spdlog::error("Audit: accumulated fees {} exceed pooled value", cfg.accumulated_fees);
        return VaultError::INVARIANT_VIOLATION;
    }
    return VaultError::OK;
}

} // namespace

VaultError AccountingEngine::audit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return check_state(config_store_.get(), treasury_.balance(), ledger_);
}

LedgerSnapshot AccountingEngine::snapshot_locked() const {
    LedgerSnapshot snap;
    snap.config = config_store_.get();
    snap.treasury = treasury_.state();
    snap.positions = ledger_.list();
    snap.last_sequence = last_sequence_;
    snap.commits = commits_;
    return snap;
}

LedgerSnapshot AccountingEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_locked();
}

VaultError AccountingEngine::restore(const LedgerSnapshot& snapshot) {
    ShareLedger::PositionMap positions;
    for (const auto& p : snapshot.positions) {
        if (p.owner.empty() || !positions.emplace(p.owner, p).second) {
            spdlog::error("Refusing snapshot: empty or duplicate position owner '{}'", p.owner);
            return VaultError::INVARIANT_VIOLATION;
        }
    }
    ShareLedger candidate;
    candidate.restore(std::move(positions));
    TreasuryAccount treasury(snapshot.treasury);
    if (auto err = check_state(snapshot.config, treasury.balance(), candidate); err != VaultError::OK) {
        spdlog::error("Refusing snapshot at seq={}", snapshot.last_sequence);
        return err;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    config_store_.replace(snapshot.config);
    treasury_ = treasury;
    ledger_ = std::move(candidate);
    last_sequence_ = snapshot.last_sequence;
    commits_ = snapshot.commits;
    spdlog::info("Ledger restored: {} positions, total_shares={}, seq={}",
                 ledger_.size(), snapshot.config.total_shares, last_sequence_);
    return VaultError::OK;
}

void AccountingEngine::add_event_callback(EventCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    event_callbacks_.push_back(std::move(cb));
}

void AccountingEngine::attach_journal(std::shared_ptr<JournalWriter> journal) {
    std::lock_guard<std::mutex> lock(mutex_);
    journal_ = std::move(journal);
}

void AccountingEngine::set_commit_hook(CommitHook hook, uint64_t interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    commit_hook_ = std::move(hook);
    commit_hook_interval_ = interval;
}

} // namespace vault_ledger
