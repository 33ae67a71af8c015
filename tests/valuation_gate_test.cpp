#include <gtest/gtest.h>
#include <limits>
#include "../src/core/valuation_gate.hpp"

using namespace vault_ledger;

namespace {

constexpr UnixSeconds NOW = 1700000000;

ProtocolConfig deployed_config() {
    ProtocolConfig cfg;
    cfg.initialized = true;
    cfg.total_trading_deployed = 90000000;
    cfg.deployed_current_value = 90000000;
    cfg.last_deployment_timestamp = NOW - 60;
    cfg.deployment_started_at = NOW - 60;
    return cfg;
}

ValuationReport report_at(UnixSeconds ts) {
    ValuationReport r;
    r.deployment_id = "grid-1";
    r.orca_positions_value = 50000000;
    r.drift_equity_value = 42000000;
    r.uncollected_fees = 1000000;
    r.unrealized_pnl = 3000000;
    r.timestamp = ts;
    return r;
}

} // namespace

TEST(ValuationGateTest, AdmitsFreshReport) {
    ValuationOracleGate gate;
    auto res = gate.admit(report_at(NOW - 10), deployed_config(), 10000000, NOW);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res->deployed_current_value, 93000000u);
    EXPECT_EQ(res->pending_unrealized_fees, 750000u);
    EXPECT_EQ(res->timestamp, NOW - 10);
}

TEST(ValuationGateTest, RejectsOutsideToleranceWindow) {
    ValuationOracleGate gate;
    auto cfg = deployed_config();
    EXPECT_TRUE(gate.admit(report_at(NOW - 300), cfg, 0, NOW).ok());
    EXPECT_EQ(gate.admit(report_at(NOW - 301), cfg, 0, NOW).error(), VaultError::INVALID_VALUATION);
    EXPECT_EQ(gate.admit(report_at(NOW + 301), cfg, 0, NOW).error(), VaultError::INVALID_VALUATION);
}

TEST(ValuationGateTest, RejectsBackwardsTimestamp) {
    ValuationOracleGate gate;
    auto cfg = deployed_config();
    cfg.last_valuation_timestamp = NOW - 5;
    EXPECT_EQ(gate.admit(report_at(NOW - 6), cfg, 0, NOW).error(), VaultError::NON_MONOTONIC_VALUATION);
    EXPECT_TRUE(gate.admit(report_at(NOW - 5), cfg, 0, NOW).ok());
}

TEST(ValuationGateTest, RejectsWhenNothingDeployed) {
    ValuationOracleGate gate;
    ProtocolConfig cfg;
    cfg.initialized = true;
    EXPECT_EQ(gate.admit(report_at(NOW), cfg, 0, NOW).error(), VaultError::INVALID_VALUATION);
}

TEST(ValuationGateTest, RejectsComponentOverflow) {
    ValuationOracleGate gate;
    auto r = report_at(NOW);
    r.orca_positions_value = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(gate.admit(r, deployed_config(), 0, NOW).error(), VaultError::INVALID_VALUATION);
}

TEST(ValuationGateTest, RejectsMarkBelowAccruedFees) {
    ValuationOracleGate gate;
    auto cfg = deployed_config();
    cfg.accumulated_fees = 5000000;
    auto r = report_at(NOW);
    r.orca_positions_value = 0;
    r.drift_equity_value = 0;
    r.uncollected_fees = 0;
    r.unrealized_pnl = -90000000;
    EXPECT_EQ(gate.admit(r, cfg, 4000000, NOW).error(), VaultError::INVALID_VALUATION);
    EXPECT_TRUE(gate.admit(r, cfg, 5000000, NOW).ok());
}

TEST(ValuationGateTest, LossesAccrueNoPendingFee) {
    ValuationOracleGate gate;
    auto r = report_at(NOW);
    r.unrealized_pnl = -1000000;
    auto res = gate.admit(r, deployed_config(), 0, NOW);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res->pending_unrealized_fees, 0u);
}

TEST(ValuationGateTest, StalenessOnlyWhileDeployed) {
    ValuationOracleGate gate(300, 86400);
    ProtocolConfig idle;
    EXPECT_FALSE(gate.staleness(idle, NOW).stale);

    auto cfg = deployed_config();
    cfg.deployment_started_at = NOW - 86400;
    EXPECT_FALSE(gate.staleness(cfg, NOW).stale);
    cfg.deployment_started_at = NOW - 86401;
    auto info = gate.staleness(cfg, NOW);
    EXPECT_TRUE(info.stale);
    EXPECT_EQ(info.age_sec, 86401);

    cfg.last_valuation_timestamp = NOW - 100;
    EXPECT_FALSE(gate.staleness(cfg, NOW).stale);
}

TEST(ValuationGateTest, TopUpDeploymentDoesNotRefreshOldMark) {
    ValuationOracleGate gate(300, 86400);
    auto cfg = deployed_config();
    cfg.deployment_started_at = NOW - 200000;
    cfg.last_valuation_timestamp = NOW - 108000;
    cfg.last_deployment_timestamp = NOW;
    auto info = gate.staleness(cfg, NOW);
    EXPECT_TRUE(info.stale);
    EXPECT_EQ(info.age_sec, 108000);

    // A mark from a previous cycle does not count for the current one.
    cfg.deployment_started_at = NOW - 50;
    cfg.last_valuation_timestamp = NOW - 100;
    info = gate.staleness(cfg, NOW);
    EXPECT_FALSE(info.stale);
    EXPECT_EQ(info.age_sec, 50);
}

TEST(ValuationGateTest, CustomToleranceFromConfig) {
    ValuationOracleGate gate(30, 3600);
    EXPECT_EQ(gate.tolerance_sec(), 30);
    EXPECT_EQ(gate.staleness_sec(), 3600);
    EXPECT_EQ(gate.admit(report_at(NOW - 31), deployed_config(), 0, NOW).error(),
              VaultError::INVALID_VALUATION);
}
