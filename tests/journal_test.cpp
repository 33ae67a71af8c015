#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "../src/core/accounting_engine.hpp"
#include "../src/core/checkpoint.hpp"
#include "../src/core/wal_logger.hpp"

using namespace vault_ledger;

namespace {

std::string fresh_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    return dir.string();
}

} // namespace

TEST(JournalTest, CommittedEventsAreJournaled) {
    auto dir = fresh_dir("vault_ledger_journal_test");
    auto journal = std::make_shared<JournalWriter>(journal_path(dir));
    ASSERT_TRUE(journal->is_open());

    auto clock = std::make_shared<LedgerClock>();
    clock->set_time_sec(1700000000);
    AccountingEngine engine(clock);
    engine.attach_journal(journal);
    InitializeParams p;
    p.admin = "admin";
    p.operator_id = "bot";
    ASSERT_TRUE(engine.initialize_protocol("admin", p).ok());
    ASSERT_TRUE(engine.deposit("alice", 2500000).ok());
    EXPECT_FALSE(engine.deposit("alice", 0).ok());
    ASSERT_TRUE(engine.deploy_capital_for_trading("bot", 1000000).ok());

    auto all = load_journal_after(journal_path(dir), 0);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0]["event"].get<std::string>(), "protocol_initialized");
    EXPECT_EQ(all[1]["event"].get<std::string>(), "position_created");
    EXPECT_EQ(all[2]["event"].get<std::string>(), "deposit");
    EXPECT_EQ(all[2]["amount"].get<uint64_t>(), 2500000u);
    EXPECT_EQ(all[3]["event"].get<std::string>(), "capital_deployed");
    EXPECT_EQ(all[3]["seq"].get<uint64_t>(), 4u);

    auto tail = load_journal_after(journal_path(dir), 2);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0]["seq"].get<uint64_t>(), 3u);
    std::filesystem::remove_all(dir);
}

TEST(JournalTest, RotatesWhenFull) {
    auto dir = fresh_dir("vault_ledger_journal_rotate");
    auto path = journal_path(dir);
    JournalWriter journal(path, 64);
    for (int i = 1; i <= 5; ++i) {
        journal.append(nlohmann::json{{"seq", i}, {"event", "deposit"}, {"padding", std::string(40, 'x')}});
    }
    EXPECT_NE(journal.active_path(), path);
    EXPECT_TRUE(std::filesystem::exists(path + ".1"));
    auto first = load_journal_after(path, 0);
    EXPECT_FALSE(first.empty());
    EXPECT_LT(first.size(), 5u);
    std::filesystem::remove_all(dir);
}

TEST(JournalTest, SkipsCorruptLines) {
    auto dir = fresh_dir("vault_ledger_journal_corrupt");
    std::filesystem::create_directories(dir);
    auto path = journal_path(dir);
    {
        std::ofstream f(path);
        f << R"({"seq":1,"event":"deposit"})" << "\n";
        f << "garbage\n\n";
        f << R"({"seq":2,"event":"withdraw"})" << "\n";
    }
    auto entries = load_journal_after(path, 0);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[1]["event"].get<std::string>(), "withdraw");
    std::filesystem::remove_all(dir);
}
