#pragma once

#include <string>
#include <fstream>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "protocol_config.hpp"
#include "valuation_gate.hpp"

namespace vault_ledger {

using json = nlohmann::json;

struct VaultConfig {
    uint32_t performance_fee_bps{DEFAULT_PERFORMANCE_FEE_BPS};
    uint32_t max_deployment_bps{DEFAULT_MAX_DEPLOYMENT_BPS};
    int64_t valuation_tolerance_sec{ValuationOracleGate::DEFAULT_TOLERANCE_SEC};
    int64_t staleness_threshold_sec{ValuationOracleGate::DEFAULT_STALENESS_SEC};
    std::string admin{};
    std::string operator_id{};
    std::string fee_recipient{};       // empty = admin
    bool auto_initialize{false};       // initialize on startup when no checkpoint exists

    InitializeParams initialize_params() const {
        InitializeParams p;
        p.admin = admin;
        p.operator_id = operator_id;
        p.performance_fee_bps = performance_fee_bps;
        p.fee_recipient = fee_recipient;
        p.max_deployment_bps = max_deployment_bps;
        return p;
    }
};

struct ServiceConfig {
    uint16_t control_port{8600};
    std::string bind_address{"127.0.0.1"};
};

struct PersistenceConfig {
    bool enable_journal{true};
    std::string data_directory{"data"};
    int checkpoint_interval_ops{100};  // 0 = only at shutdown
    size_t journal_max_bytes{50 * 1024 * 1024};
};

struct LoggingConfig {
    std::string level{"info"};
    std::string file{};                // empty = console only
};

struct AuthConfig {
    std::string token{};
    size_t requests_per_minute{600};   // per caller; 0 = unlimited
};

struct Config {
    VaultConfig vault;
    ServiceConfig services;
    PersistenceConfig persistence;
    LoggingConfig logging;
    AuthConfig auth;
};

inline void load_config(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        spdlog::warn("Config file {} not found, using defaults", path);
        return;
    }
    json j = json::parse(f, nullptr, false, true);
    if (j.is_discarded()) {
        spdlog::error("Config file {} is not valid JSON, using defaults", path);
        return;
    }
    if (j.contains("vault")) {
        auto& v = j["vault"];
        cfg.vault.performance_fee_bps = v.value("performance_fee_bps", cfg.vault.performance_fee_bps);
        cfg.vault.max_deployment_bps = v.value("max_deployment_bps", cfg.vault.max_deployment_bps);
        cfg.vault.valuation_tolerance_sec = v.value("valuation_tolerance_sec", cfg.vault.valuation_tolerance_sec);
        cfg.vault.staleness_threshold_sec = v.value("staleness_threshold_sec", cfg.vault.staleness_threshold_sec);
        cfg.vault.admin = v.value("admin", cfg.vault.admin);
        cfg.vault.operator_id = v.value("operator", cfg.vault.operator_id);
        cfg.vault.fee_recipient = v.value("fee_recipient", cfg.vault.fee_recipient);
        cfg.vault.auto_initialize = v.value("auto_initialize", cfg.vault.auto_initialize);
    }
    if (j.contains("services")) {
        auto& svc = j["services"];
        cfg.services.control_port = svc.value("control_port", cfg.services.control_port);
        cfg.services.bind_address = svc.value("bind_address", cfg.services.bind_address);
    }
    if (j.contains("persistence")) {
        auto& p = j["persistence"];
        cfg.persistence.enable_journal = p.value("enable_journal", cfg.persistence.enable_journal);
        cfg.persistence.data_directory = p.value("data_directory", cfg.persistence.data_directory);
        cfg.persistence.checkpoint_interval_ops = p.value("checkpoint_interval_ops", cfg.persistence.checkpoint_interval_ops);
        cfg.persistence.journal_max_bytes = p.value("journal_max_bytes", cfg.persistence.journal_max_bytes);
    }
    if (j.contains("logging")) {
        auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.file = l.value("file", cfg.logging.file);
    }
    if (j.contains("auth")) {
        auto& a = j["auth"];
        cfg.auth.token = a.value("token", cfg.auth.token);
        cfg.auth.requests_per_minute = a.value("requests_per_minute", cfg.auth.requests_per_minute);
    }
}

} // namespace vault_ledger
