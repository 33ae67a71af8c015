#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>

#include "errors.hpp"
#include "fixed_point.hpp"
#include "protocol_config.hpp"
#include "share_ledger.hpp"
#include "treasury_account.hpp"
#include "valuation_gate.hpp"
#include "ledger_events.hpp"
#include "ledger_transaction.hpp"
#include "time_engine.hpp"
#include "wal_logger.hpp"

namespace vault_ledger {

struct DepositReceipt {
    std::string owner;
    Amount amount{0};
    Shares shares_minted{0};
    Shares position_shares{0};
    Shares total_shares{0};
    Amount treasury_balance{0};
};

struct WithdrawReceipt {
    std::string owner;
    Amount payout{0};
    Shares shares_burned{0};
    Shares remaining_shares{0};
    Amount treasury_balance{0};
};

struct DeploymentReceipt {
    Amount amount{0};
    Amount total_deployed{0};
    Amount deployed_current_value{0};
    Amount treasury_remaining{0};
};

struct ReturnReceipt {
    Amount amount_returned{0};
    Amount principal_returned{0};
    SignedAmount realized_pnl{0};
    Amount fee_accrued{0};
    Amount total_deployed{0};
    Amount treasury_balance{0};
};

struct BalanceQuote {
    Amount amount{0};
    bool stale{false};
    int64_t valuation_age_sec{0};
};

struct ProtocolStats {
    Amount tvl{0};
    Amount idle_balance{0};
    Amount total_trading_deployed{0};
    Amount deployed_current_value{0};
    Amount accumulated_fees{0};
    Amount pending_unrealized_fees{0};
    Shares total_shares{0};
    Amount nav_per_share{AMOUNT_SCALE};
    size_t position_count{0};
    bool paused{false};
    bool valuation_stale{false};
    UnixSeconds last_valuation_timestamp{0};
    UnixSeconds last_fee_sweep{0};
};

struct UserStats {
    std::string owner;
    Shares shares{0};
    Amount balance{0};
    Amount deposited_amount{0};
    Amount withdrawn_amount{0};
    Amount high_water_mark{0};
    Amount gain_above_high_water_mark{0};
};

/**
 * Full ledger image used for checkpoints and crash recovery.
 */
struct LedgerSnapshot {
    ProtocolConfig config;
    TreasuryState treasury;
    std::vector<UserPosition> positions;
    uint64_t last_sequence{0};
    uint64_t commits{0};
};

class AccountingEngine {
public:
    using EventCallback = std::function<void(const LedgerEvent&)>;
    using CommitHook = std::function<void(const LedgerSnapshot&)>;

    explicit AccountingEngine(std::shared_ptr<LedgerClock> clock = nullptr,
                              ValuationOracleGate gate = ValuationOracleGate{});

    AccountingEngine(const AccountingEngine&) = delete;
    AccountingEngine& operator=(const AccountingEngine&) = delete;

    // Admin-only: the caller must be the admin being installed.
    Result<ProtocolConfig> initialize_protocol(const std::string& caller, const InitializeParams& params);

    Result<UserPosition> create_user_position(const std::string& owner);

    Result<DepositReceipt> deposit(const std::string& owner, Amount amount, Shares min_shares = 0);

    // Redeem a share count; pays floor(shares * nav).
    Result<WithdrawReceipt> withdraw(const std::string& owner, Shares shares, Amount min_payout = 0);

    // Pay out an exact amount; burns ceil(amount / nav) shares, at most max_shares.
    Result<WithdrawReceipt> withdraw_amount(const std::string& owner, Amount amount, Shares max_shares);

    Result<DeploymentReceipt> deploy_capital_for_trading(const std::string& caller, Amount amount);

    Result<ReturnReceipt> return_capital_from_trading(const std::string& caller,
                                                      Amount amount_returned,
                                                      SignedAmount realized_pnl);

    Result<AdmittedValuation> update_deployment_valuation(const std::string& caller,
                                                          const ValuationReport& report);

    Result<Amount> sweep_fees(const std::string& caller);

    Result<bool> pause_protocol(const std::string& caller);
    Result<bool> unpause_protocol(const std::string& caller);

    // Read-only views.
    Result<BalanceQuote> calculate_user_balance(const std::string& owner) const;
    Result<ProtocolStats> protocol_stats() const;
    Result<UserStats> user_stats(const std::string& owner) const;

    std::optional<UserPosition> position(const std::string& owner) const;
    std::vector<UserPosition> positions() const;
    ProtocolConfig config() const;
    TreasuryState treasury() const;

    // Full recount of totalShares against every position, plus fee coverage.
    VaultError audit() const;

    LedgerSnapshot snapshot() const;
    // Installs the snapshot after the audit checks; a failing snapshot leaves state untouched.
    VaultError restore(const LedgerSnapshot& snapshot);

    void add_event_callback(EventCallback cb);
    void attach_journal(std::shared_ptr<JournalWriter> journal);
    // Invoked with a fresh snapshot every `interval` commits, after the ledger lock is released.
    void set_commit_hook(CommitHook hook, uint64_t interval);

    const ValuationOracleGate& gate() const { return gate_; }
    std::shared_ptr<LedgerClock> clock() const { return clock_; }

private:
    VaultError require_initialized() const;
    // Verifies, applies and publishes; returns the verification result.
    VaultError commit(LedgerTransaction& tx, std::unique_lock<std::mutex>& lock);
    LedgerSnapshot snapshot_locked() const;

    std::shared_ptr<LedgerClock> clock_;
    ValuationOracleGate gate_;

    mutable std::mutex mutex_;
    ConfigStore config_store_;
    TreasuryAccount treasury_;
    ShareLedger ledger_;
    uint64_t last_sequence_{0};
    uint64_t commits_{0};

    std::mutex callbacks_mutex_;
    std::vector<EventCallback> event_callbacks_;
    std::shared_ptr<JournalWriter> journal_;
    CommitHook commit_hook_;
    uint64_t commit_hook_interval_{0};
    std::mutex hook_mutex_;
    uint64_t last_hooked_sequence_{0};
};

} // namespace vault_ledger
