#include <gtest/gtest.h>
#include <memory>
#include <random>
#include <string>
#include <vector>
#include "../src/core/accounting_engine.hpp"

using namespace vault_ledger;

namespace {

constexpr UnixSeconds START = 1700000000;
const std::string ADMIN = "admin";
const std::string BOT = "bot";
const std::vector<std::string> USERS{"alice", "bob", "carol", "dave"};

std::unique_ptr<AccountingEngine> make_engine(const std::shared_ptr<LedgerClock>& clock) {
    auto engine = std::make_unique<AccountingEngine>(clock);
    InitializeParams p;
    p.admin = ADMIN;
    p.operator_id = BOT;
    auto res = engine->initialize_protocol(ADMIN, p);
    EXPECT_TRUE(res.ok());
    return engine;
}

// Value a holder would receive for `shares`, straight from the committed aggregates.
Amount holder_value(const AccountingEngine& engine, Shares shares) {
    auto cfg = engine.config();
    NavInputs in{engine.treasury().idle_balance, cfg.deployed_current_value,
                 cfg.accumulated_fees, cfg.total_shares};
    auto v = nav::value_of_shares(shares, in);
    return v.ok() ? *v : 0;
}

void expect_consistent(const AccountingEngine& engine) {
    EXPECT_EQ(engine.audit(), VaultError::OK);
    Shares sum = 0;
    for (const auto& p : engine.positions()) sum += p.shares;
    auto cfg = engine.config();
    EXPECT_EQ(sum, cfg.total_shares);
    EXPECT_LE(cfg.accumulated_fees, engine.treasury().idle_balance + cfg.deployed_current_value);
    EXPECT_LE(cfg.performance_fee_bps, BPS_DENOMINATOR);
}

} // namespace

TEST(LedgerPropertyTest, RandomSequencesPreserveShareInvariant) {
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        std::mt19937_64 rng(seed);
        auto clock = std::make_shared<LedgerClock>();
        clock->set_time_sec(START);
        auto engine = make_engine(clock);
        UnixSeconds last_mark = 0;

        for (int step = 0; step < 300; ++step) {
            const auto& user = USERS[rng() % USERS.size()];
            auto cfg = engine->config();
            switch (rng() % 6) {
                case 0: {
                    Amount amount = 1000000 + rng() % 1000000000;
                    auto before = engine->position(user);
                    Shares held = before ? before->shares : 0;
                    Amount value_before = holder_value(*engine, cfg.total_shares - held);
                    auto res = engine->deposit(user, amount);
                    if (res.ok() && cfg.total_shares > held) {
                        // Other holders never lose value to a new deposit.
                        EXPECT_GE(holder_value(*engine, cfg.total_shares - held), value_before);
                    }
                    break;
                }
                case 1: {
                    auto pos = engine->position(user);
                    if (!pos || pos->shares == 0) break;
                    Shares shares = 1 + rng() % pos->shares;
                    (void)engine->withdraw(user, shares);
                    break;
                }
                case 2: {
                    Amount idle = engine->treasury().idle_balance;
                    if (idle == 0) break;
                    (void)engine->deploy_capital_for_trading(BOT, 1 + rng() % idle);
                    break;
                }
                case 3: {
                    if (cfg.total_trading_deployed == 0) break;
                    Amount principal = 1 + rng() % cfg.total_trading_deployed;
                    int64_t swing = static_cast<int64_t>(principal / 10);
                    SignedAmount pnl = swing > 0 ? static_cast<SignedAmount>(rng() % (2 * swing + 1)) - swing : 0;
                    Amount returned = static_cast<Amount>(static_cast<int64_t>(principal) + pnl);
                    (void)engine->return_capital_from_trading(BOT, returned, pnl);
                    break;
                }
                case 4: {
                    if (cfg.total_trading_deployed == 0) break;
                    clock->advance(std::chrono::seconds(60));
                    UnixSeconds now = clock->now_sec();
                    Amount base = cfg.total_trading_deployed;
                    Amount current = base - base / 5 + rng() % (base / 5 * 2 + 1);
                    ValuationReport r;
                    r.orca_positions_value = current / 2;
                    r.drift_equity_value = current - current / 2;
                    r.unrealized_pnl = static_cast<SignedAmount>(current) - static_cast<SignedAmount>(base);
                    r.timestamp = now;
                    auto res = engine->update_deployment_valuation(BOT, r);
                    if (res.ok()) {
                        EXPECT_GE(now, last_mark);
                        last_mark = now;
                    }
                    break;
                }
                default:
                    (void)engine->sweep_fees(ADMIN);
                    break;
            }
            expect_consistent(*engine);
        }
    }
}

TEST(LedgerPropertyTest, DepositKeepsNavPerShare) {
    std::mt19937_64 rng(42);
    auto clock = std::make_shared<LedgerClock>();
    clock->set_time_sec(START);
    auto engine = make_engine(clock);
    ASSERT_TRUE(engine->deposit("alice", 100000000).ok());
    ASSERT_TRUE(engine->deploy_capital_for_trading(BOT, 50000000).ok());
    ASSERT_TRUE(engine->return_capital_from_trading(BOT, 20000000, 7000000).ok());

    for (int i = 0; i < 200; ++i) {
        auto before = engine->protocol_stats();
        ASSERT_TRUE(before.ok());
        Amount amount = 1000000 + rng() % 500000000;
        ASSERT_TRUE(engine->deposit(USERS[i % USERS.size()], amount).ok());
        auto after = engine->protocol_stats();
        ASSERT_TRUE(after.ok());
        EXPECT_GE(after->nav_per_share, before->nav_per_share);
        EXPECT_LE(after->nav_per_share - before->nav_per_share, 1u);
    }
}

TEST(LedgerPropertyTest, DepositThenFullWithdrawRoundTrips) {
    auto clock = std::make_shared<LedgerClock>();
    clock->set_time_sec(START);
    auto engine = make_engine(clock);
    ASSERT_TRUE(engine->deposit("alice", 100000000).ok());

    // At par the round trip is lossless up to one unit.
    auto nav_before = engine->protocol_stats()->nav_per_share;
    auto dep = engine->deposit("bob", 123456789);
    ASSERT_TRUE(dep.ok());
    auto wd = engine->withdraw("bob", dep->shares_minted);
    ASSERT_TRUE(wd.ok());
    EXPECT_LE(123456789u - wd->payout, 1u);
    EXPECT_EQ(engine->protocol_stats()->nav_per_share, nav_before);

    // Below par after a realized loss.
    ASSERT_TRUE(engine->deploy_capital_for_trading(BOT, 50000000).ok());
    ASSERT_TRUE(engine->return_capital_from_trading(BOT, 33333333, -16666667).ok());
    for (Amount amount : {Amount{1}, Amount{7}, Amount{999999}, Amount{314159265}}) {
        auto dep2 = engine->deposit("carol", amount);
        if (!dep2.ok()) {
            EXPECT_EQ(dep2.error(), VaultError::SLIPPAGE_EXCEEDED);
            continue;
        }
        auto wd2 = engine->withdraw("carol", dep2->shares_minted);
        ASSERT_TRUE(wd2.ok());
        EXPECT_LE(wd2->payout, amount);
        EXPECT_LE(amount - wd2->payout, 1u);
    }
    EXPECT_EQ(engine->audit(), VaultError::OK);
}
