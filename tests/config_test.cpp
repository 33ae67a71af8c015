#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../src/core/config.hpp"

using namespace vault_ledger;

namespace {

std::string write_temp(const std::string& name, const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream f(path);
    f << body;
    return path.string();
}

} // namespace

TEST(ConfigTest, MissingFileKeepsDefaults) {
    Config cfg;
    load_config(cfg, "/nonexistent/vault_ledger/settings.json");
    EXPECT_EQ(cfg.vault.performance_fee_bps, 2500u);
    EXPECT_EQ(cfg.vault.max_deployment_bps, 9000u);
    EXPECT_EQ(cfg.vault.valuation_tolerance_sec, 300);
    EXPECT_EQ(cfg.vault.staleness_threshold_sec, 86400);
    EXPECT_EQ(cfg.services.control_port, 8600);
    EXPECT_EQ(cfg.persistence.data_directory, "data");
    EXPECT_EQ(cfg.persistence.checkpoint_interval_ops, 100);
    EXPECT_FALSE(cfg.vault.auto_initialize);
}

TEST(ConfigTest, OverridesOnlyPresentKeys) {
    auto path = write_temp("vault_ledger_config_test.json", R"({
        // comments are allowed
        "vault": {"performance_fee_bps": 2000, "admin": "ops-admin", "operator": "grid-bot"},
        "services": {"control_port": 9100},
        "persistence": {"enable_journal": false},
        "logging": {"level": "debug"},
        "auth": {"token": "secret", "requests_per_minute": 10}
    })");
    Config cfg;
    load_config(cfg, path);
    EXPECT_EQ(cfg.vault.performance_fee_bps, 2000u);
    EXPECT_EQ(cfg.vault.max_deployment_bps, 9000u);
    EXPECT_EQ(cfg.vault.admin, "ops-admin");
    EXPECT_EQ(cfg.vault.operator_id, "grid-bot");
    EXPECT_EQ(cfg.services.control_port, 9100);
    EXPECT_EQ(cfg.services.bind_address, "127.0.0.1");
    EXPECT_FALSE(cfg.persistence.enable_journal);
    EXPECT_EQ(cfg.persistence.data_directory, "data");
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.auth.token, "secret");
    EXPECT_EQ(cfg.auth.requests_per_minute, 10u);
    std::filesystem::remove(path);
}

TEST(ConfigTest, MalformedFileKeepsDefaults) {
    auto path = write_temp("vault_ledger_config_bad.json", "{ \"vault\": ");
    Config cfg;
    load_config(cfg, path);
    EXPECT_EQ(cfg.vault.performance_fee_bps, 2500u);
    std::filesystem::remove(path);
}

TEST(ConfigTest, InitializeParamsFromVaultSection) {
    VaultConfig v;
    v.admin = "a";
    v.operator_id = "b";
    v.fee_recipient = "treasury-multisig";
    v.max_deployment_bps = 5000;
    auto p = v.initialize_params();
    EXPECT_EQ(p.admin, "a");
    EXPECT_EQ(p.operator_id, "b");
    EXPECT_EQ(p.fee_recipient, "treasury-multisig");
    EXPECT_EQ(p.max_deployment_bps, 5000u);
    EXPECT_EQ(p.performance_fee_bps, 2500u);
}
