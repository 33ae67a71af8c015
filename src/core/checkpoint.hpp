#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <fstream>
#include <filesystem>
#include <optional>
#include <chrono>
#include <vector>
#include <spdlog/spdlog.h>
#include "accounting_engine.hpp"

namespace vault_ledger {

inline std::string checkpoint_path(const std::string& dir) {
    return dir + "/ledger.ckpt.json";
}

inline std::string journal_path(const std::string& dir) {
    return dir + "/ledger.journal.jsonl";
}

inline nlohmann::json config_to_json(const ProtocolConfig& c) {
    return nlohmann::json{
        {"initialized", c.initialized},
        {"admin", c.admin},
        {"operator", c.operator_id},
        {"fee_recipient", c.fee_recipient},
        {"treasury", c.treasury},
        {"total_shares", c.total_shares},
        {"total_trading_deployed", c.total_trading_deployed},
        {"accumulated_fees", c.accumulated_fees},
        {"performance_fee_bps", c.performance_fee_bps},
        {"max_deployment_bps", c.max_deployment_bps},
        {"is_paused", c.is_paused},
        {"last_fee_sweep", c.last_fee_sweep},
        {"deployed_current_value", c.deployed_current_value},
        {"last_valuation_timestamp", c.last_valuation_timestamp},
        {"last_deployment_timestamp", c.last_deployment_timestamp},
        {"deployment_started_at", c.deployment_started_at},
        {"pending_unrealized_fees", c.pending_unrealized_fees}
    };
}

inline ProtocolConfig config_from_json(const nlohmann::json& j) {
    ProtocolConfig c;
    c.initialized = j.value("initialized", false);
    c.admin = j.value("admin", "");
    c.operator_id = j.value("operator", "");
    c.fee_recipient = j.value("fee_recipient", "");
    c.treasury = j.value("treasury", std::string(TREASURY_ACCOUNT_ID));
    c.total_shares = j.value("total_shares", Shares{0});
    c.total_trading_deployed = j.value("total_trading_deployed", Amount{0});
    c.accumulated_fees = j.value("accumulated_fees", Amount{0});
    c.performance_fee_bps = j.value("performance_fee_bps", DEFAULT_PERFORMANCE_FEE_BPS);
    c.max_deployment_bps = j.value("max_deployment_bps", DEFAULT_MAX_DEPLOYMENT_BPS);
    c.is_paused = j.value("is_paused", false);
    c.last_fee_sweep = j.value("last_fee_sweep", UnixSeconds{0});
    c.deployed_current_value = j.value("deployed_current_value", Amount{0});
    c.last_valuation_timestamp = j.value("last_valuation_timestamp", UnixSeconds{0});
    c.last_deployment_timestamp = j.value("last_deployment_timestamp", UnixSeconds{0});
    c.deployment_started_at = j.value("deployment_started_at", c.last_deployment_timestamp);
    c.pending_unrealized_fees = j.value("pending_unrealized_fees", Amount{0});
    return c;
}

/**
 * Writes the snapshot to <dir>/ledger.ckpt.json via a temp file and rename,
 * so a crash mid-write leaves the previous checkpoint intact.
 */
inline bool save_checkpoint(const LedgerSnapshot& snap, const std::string& dir = "data") {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Cannot create checkpoint directory {}: {}", dir, ec.message());
        return false;
    }

    nlohmann::json j;
    j["checkpoint_sec"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    j["last_sequence"] = snap.last_sequence;
    j["commits"] = snap.commits;
    j["config"] = config_to_json(snap.config);
    j["treasury"] = {
        {"idle_balance", snap.treasury.idle_balance},
        {"lifetime_inflows", snap.treasury.lifetime_inflows},
        {"lifetime_outflows", snap.treasury.lifetime_outflows}
    };

    nlohmann::json pos = nlohmann::json::array();
    for (const auto& p : snap.positions) {
        pos.push_back({
            {"owner", p.owner},
            {"shares", p.shares},
            {"deposited_amount", p.deposited_amount},
            {"withdrawn_amount", p.withdrawn_amount},
            {"high_water_mark", p.high_water_mark},
            {"created_at", p.created_at}
        });
    }
    j["positions"] = pos;

    std::string path = checkpoint_path(dir);
    std::string tmp_path = path + ".tmp";

    std::ofstream f(tmp_path, std::ios::out | std::ios::trunc);
    if (!f.is_open()) {
        spdlog::error("Failed to save checkpoint to {}", tmp_path);
        return false;
    }
    f << j.dump(2);
    f.close();
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        spdlog::error("Failed to rename checkpoint {}: {}", tmp_path, ec.message());
        return false;
    }
    spdlog::debug("Saved checkpoint at seq={} ({} positions)", snap.last_sequence, snap.positions.size());
    return true;
}

inline std::optional<LedgerSnapshot> load_checkpoint(const std::string& dir = "data") {
    std::ifstream f(checkpoint_path(dir));
    if (!f.is_open()) return std::nullopt;

    auto j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Failed to parse checkpoint in {}", dir);
        return std::nullopt;
    }

    LedgerSnapshot snap;
    try {
        snap.last_sequence = j.value("last_sequence", uint64_t{0});
        snap.commits = j.value("commits", uint64_t{0});
        if (j.contains("config")) {
            snap.config = config_from_json(j["config"]);
        }
        if (j.contains("treasury")) {
            const auto& t = j["treasury"];
            snap.treasury.idle_balance = t.value("idle_balance", Amount{0});
            snap.treasury.lifetime_inflows = t.value("lifetime_inflows", Amount{0});
            snap.treasury.lifetime_outflows = t.value("lifetime_outflows", Amount{0});
        }
        if (j.contains("positions")) {
            for (const auto& p : j["positions"]) {
                UserPosition pos;
                pos.owner = p.value("owner", "");
                if (pos.owner.empty()) continue;
                pos.shares = p.value("shares", Shares{0});
                pos.deposited_amount = p.value("deposited_amount", Amount{0});
                pos.withdrawn_amount = p.value("withdrawn_amount", Amount{0});
                pos.high_water_mark = p.value("high_water_mark", Amount{0});
                pos.created_at = p.value("created_at", UnixSeconds{0});
                snap.positions.push_back(std::move(pos));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Checkpoint in {} has malformed fields: {}", dir, e.what());
        return std::nullopt;
    }
    spdlog::info("Loaded checkpoint from {} at seq={}", dir, snap.last_sequence);
    return snap;
}

} // namespace vault_ledger
