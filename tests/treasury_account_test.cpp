#include <gtest/gtest.h>
#include <limits>
#include "../src/core/treasury_account.hpp"

using namespace vault_ledger;

TEST(TreasuryAccountTest, CreditAndDebitTrackFlows) {
    TreasuryAccount t;
    EXPECT_EQ(t.credit(1000), VaultError::OK);
    EXPECT_EQ(t.debit(400), VaultError::OK);
    EXPECT_EQ(t.balance(), 600u);
    EXPECT_EQ(t.state().lifetime_inflows, 1000u);
    EXPECT_EQ(t.state().lifetime_outflows, 400u);
}

TEST(TreasuryAccountTest, DebitBeyondBalanceLeavesStateUntouched) {
    TreasuryAccount t;
    ASSERT_EQ(t.credit(100), VaultError::OK);
    auto before = t.state();
    EXPECT_EQ(t.debit(101), VaultError::INSUFFICIENT_LIQUIDITY);
    EXPECT_TRUE(t.state() == before);
}

TEST(TreasuryAccountTest, CreditOverflowRejected) {
    TreasuryState st;
    st.idle_balance = std::numeric_limits<uint64_t>::max() - 1;
    TreasuryAccount t(st);
    EXPECT_EQ(t.credit(2), VaultError::MATH_OVERFLOW);
    EXPECT_EQ(t.balance(), std::numeric_limits<uint64_t>::max() - 1);
}

TEST(TreasuryAccountTest, AvailableExcludesReservedFees) {
    TreasuryAccount t;
    ASSERT_EQ(t.credit(500), VaultError::OK);
    EXPECT_EQ(t.available(200), 300u);
    EXPECT_EQ(t.available(900), 0u);
}
