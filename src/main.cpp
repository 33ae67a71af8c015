#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <drogon/drogon.h>
#include "core/config.hpp"
#include "core/accounting_engine.hpp"
#include "core/checkpoint.hpp"
#include "core/wal_logger.hpp"
#include "control/control_server.hpp"

namespace {

void setup_logging(const vault_ledger::LoggingConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file, false));
        } catch (const spdlog::spdlog_ex& e) {
            spdlog::error("Cannot open log file {}: {}", cfg.file, e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("vault_ledger", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(cfg.level));
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/settings.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    vault_ledger::Config cfg;
    vault_ledger::load_config(cfg, config_path);
    setup_logging(cfg.logging);
    spdlog::info("Vault ledger starting. Control port={} bind={}",
                 cfg.services.control_port, cfg.services.bind_address);

    auto clock = std::make_shared<vault_ledger::LedgerClock>();
    vault_ledger::ValuationOracleGate gate(cfg.vault.valuation_tolerance_sec,
                                           cfg.vault.staleness_threshold_sec);
    auto engine = std::make_shared<vault_ledger::AccountingEngine>(clock, gate);

    const auto& dir = cfg.persistence.data_directory;
    if (auto snap = vault_ledger::load_checkpoint(dir)) {
        if (engine->restore(*snap) != vault_ledger::VaultError::OK) {
            spdlog::error("Checkpoint in {} failed the ledger audit; refusing to start", dir);
            return 1;
        }
        auto tail = vault_ledger::load_journal_after(vault_ledger::journal_path(dir), snap->last_sequence);
        if (!tail.empty()) {
            spdlog::warn("{} journal records after checkpoint seq={} were not captured by the checkpoint",
                         tail.size(), snap->last_sequence);
        }
    }
    if (cfg.persistence.enable_journal) {
        engine->attach_journal(std::make_shared<vault_ledger::JournalWriter>(
            vault_ledger::journal_path(dir), cfg.persistence.journal_max_bytes));
    }
    if (cfg.persistence.checkpoint_interval_ops > 0) {
        engine->set_commit_hook([dir](const vault_ledger::LedgerSnapshot& snap) {
            vault_ledger::save_checkpoint(snap, dir);
        }, static_cast<uint64_t>(cfg.persistence.checkpoint_interval_ops));
    }

    if (cfg.vault.auto_initialize && !engine->config().initialized) {
        auto params = cfg.vault.initialize_params();
        auto res = engine->initialize_protocol(params.admin, params);
        if (!res) {
            spdlog::error("Auto-initialize failed: {}", vault_ledger::to_string(res.error()));
            return 1;
        }
    }

    auto api_ctrl = std::make_shared<vault_ledger::ControlServer>(engine, cfg);
    drogon::app().addListener(cfg.services.bind_address, cfg.services.control_port);
    drogon::app().registerController(api_ctrl);
    spdlog::info("Starting Drogon listener on {}:{}", cfg.services.bind_address, cfg.services.control_port);
    drogon::app().run();

    if (!vault_ledger::save_checkpoint(engine->snapshot(), dir)) {
        spdlog::error("Final checkpoint failed");
        return 1;
    }
    spdlog::info("Vault ledger stopped");
    return 0;
}
