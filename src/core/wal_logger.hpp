#pragma once

#include <fstream>
#include <mutex>
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "ledger_events.hpp"

namespace vault_ledger {

/**
 * Append-only JSONL journal of committed ledger events.
 * Rolls over to <path>.N once the active file reaches max_bytes.
 */
class JournalWriter {
public:
    JournalWriter(const std::string& path, size_t max_bytes = 50 * 1024 * 1024)
        : base_path_(path), max_bytes_(max_bytes) {
        auto parent = std::filesystem::path(base_path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) spdlog::error("Cannot create journal directory {}: {}", parent.string(), ec.message());
        }
        open_stream(base_path_);
    }

    void append(const LedgerEvent& ev) {
        append(event_to_json(ev));
    }

    void append(const nlohmann::json& j) {
        std::lock_guard<std::mutex> lock(mu_);
        if (!stream_.is_open()) return;
        std::string line = j.dump();
        stream_ << line << "\n";
        stream_.flush();
        current_size_ += line.size() + 1;
        if (current_size_ >= max_bytes_) {
            rotate();
        }
    }

    std::string active_path() const {
        std::lock_guard<std::mutex> lock(mu_);
        return active_path_;
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mu_);
        return stream_.is_open();
    }

private:
    void open_stream(const std::string& p) {
        stream_.open(p, std::ios::out | std::ios::app);
        if (!stream_.is_open()) {
            spdlog::error("Cannot open journal {}", p);
        }
        active_path_ = p;
        std::error_code ec;
        current_size_ = std::filesystem::exists(p, ec) ? std::filesystem::file_size(p, ec) : 0;
        if (ec) current_size_ = 0;
    }

    void rotate() {
        stream_.close();
        ++roll_idx_;
        open_stream(base_path_ + "." + std::to_string(roll_idx_));
    }

    std::string base_path_;
    std::string active_path_;
    size_t max_bytes_;
    size_t current_size_{0};
    size_t roll_idx_{0};
    std::ofstream stream_;
    mutable std::mutex mu_;
};

/**
 * Reads journal lines with seq greater than after_seq. Unparseable lines are skipped.
 */
inline std::vector<nlohmann::json> load_journal_after(const std::string& path, uint64_t after_seq) {
    std::vector<nlohmann::json> entries;
    std::ifstream f(path);
    if (!f.is_open()) return entries;

    std::string line;
    while (std::getline(f, line)) {
        if (line.empty()) continue;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) continue;
        if (j.value("seq", uint64_t{0}) <= after_seq) continue;
        entries.push_back(std::move(j));
    }
    spdlog::debug("Loaded {} journal entries after seq={} from {}", entries.size(), after_seq, path);
    return entries;
}

} // namespace vault_ledger
