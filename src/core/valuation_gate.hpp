#pragma once

#include <string>
#include <cstdint>
#include "errors.hpp"
#include "fixed_point.hpp"
#include "protocol_config.hpp"

namespace vault_ledger {

/**
 * Mark-to-market of deployed capital as produced by the off-chain reporter.
 * Values are 1e6 fixed-point; timestamp is Unix seconds.
 */
struct ValuationReport {
    std::string deployment_id;
    Amount orca_positions_value{0};
    Amount drift_equity_value{0};
    Amount uncollected_fees{0};
    SignedAmount unrealized_pnl{0};
    UnixSeconds timestamp{0};
};

// Accepted report, ready to be written into ProtocolConfig.
struct AdmittedValuation {
    Amount deployed_current_value{0};
    Amount pending_unrealized_fees{0};
    UnixSeconds timestamp{0};
};

struct StalenessInfo {
    bool stale{false};
    int64_t age_sec{0};
};

class ValuationOracleGate {
public:
    static constexpr int64_t DEFAULT_TOLERANCE_SEC = 5 * 60;
    static constexpr int64_t DEFAULT_STALENESS_SEC = 24 * 60 * 60;

    explicit ValuationOracleGate(int64_t tolerance_sec = DEFAULT_TOLERANCE_SEC,
                                 int64_t staleness_sec = DEFAULT_STALENESS_SEC)
        : tolerance_sec_(tolerance_sec), staleness_sec_(staleness_sec) {}

    /**
     * Checks freshness, monotonicity and arithmetic of a report against the
     * current config. Authorization is the caller's concern.
     */
    Result<AdmittedValuation> admit(const ValuationReport& report,
                                    const ProtocolConfig& cfg,
                                    Amount idle_balance,
                                    UnixSeconds now) const;

    // Advisory; reads are never blocked by staleness.
    StalenessInfo staleness(const ProtocolConfig& cfg, UnixSeconds now) const;

    int64_t tolerance_sec() const { return tolerance_sec_; }
    int64_t staleness_sec() const { return staleness_sec_; }

private:
    int64_t tolerance_sec_;
    int64_t staleness_sec_;
};

} // namespace vault_ledger
