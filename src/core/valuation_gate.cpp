#include "valuation_gate.hpp"
#include <spdlog/spdlog.h>

namespace vault_ledger {

Result<AdmittedValuation> ValuationOracleGate::admit(const ValuationReport& report,
                                                     const ProtocolConfig& cfg,
                                                     Amount idle_balance,
                                                     UnixSeconds now) const {
    if (cfg.total_trading_deployed == 0) {
        spdlog::warn("Valuation rejected: nothing deployed (deployment={})", report.deployment_id);
        return VaultError::INVALID_VALUATION;
    }

    // |now - ts| without signed overflow on hostile timestamps.
    uint64_t skew = report.timestamp >= now
        ? static_cast<uint64_t>(report.timestamp) - static_cast<uint64_t>(now)
        : static_cast<uint64_t>(now) - static_cast<uint64_t>(report.timestamp);
    if (skew > static_cast<uint64_t>(tolerance_sec_)) {
        spdlog::warn("Valuation rejected: timestamp {} outside {}s of now={}",
                     report.timestamp, tolerance_sec_, now);
        return VaultError::INVALID_VALUATION;
    }
    if (report.timestamp < cfg.last_valuation_timestamp) {
        spdlog::warn("Valuation rejected: timestamp {} precedes last mark {}",
                     report.timestamp, cfg.last_valuation_timestamp);
        return VaultError::NON_MONOTONIC_VALUATION;
    }

    auto partial = fixed::checked_add(report.orca_positions_value, report.drift_equity_value);
    if (!partial) return VaultError::INVALID_VALUATION;
    auto current = fixed::checked_add(*partial, report.uncollected_fees);
    if (!current) return VaultError::INVALID_VALUATION;

    // A mark that leaves fees larger than the pool would make NAV negative.
    auto total_value = fixed::checked_add(idle_balance, *current);
    if (!total_value || *total_value < cfg.accumulated_fees) {
        spdlog::warn("Valuation rejected: mark {} cannot cover accrued fees {}",
                     *current, cfg.accumulated_fees);
        return VaultError::INVALID_VALUATION;
    }

    Amount gain = report.unrealized_pnl > 0 ? static_cast<Amount>(report.unrealized_pnl) : 0;
    auto pending = fixed::bps_of(gain, cfg.performance_fee_bps);
    if (!pending) return VaultError::MATH_OVERFLOW;

    AdmittedValuation out;
    out.deployed_current_value = *current;
    out.pending_unrealized_fees = *pending;
    out.timestamp = report.timestamp;
    return out;
}

StalenessInfo ValuationOracleGate::staleness(const ProtocolConfig& cfg, UnixSeconds now) const {
    StalenessInfo info;
    if (cfg.total_trading_deployed == 0) return info;
    // A mark taken during the current deployment cycle ages from its own
    // timestamp; later top-up deployments do not refresh it.
    UnixSeconds reference = cfg.last_valuation_timestamp >= cfg.deployment_started_at
        ? cfg.last_valuation_timestamp
        : cfg.deployment_started_at;
    info.age_sec = now > reference ? now - reference : 0;
    info.stale = info.age_sec > staleness_sec_;
    return info;
}

} // namespace vault_ledger
