#include <gtest/gtest.h>
#include "pool/collateral_pool.hpp"

using namespace btcfi;

class CollateralPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.min_deposit = 10000;
        pool_ = std::make_unique<CollateralPool>(config_);
    }

    // total == available + locked must hold after every operation
    void ExpectConserved() {
        auto snap = pool_->snapshot();
        EXPECT_EQ(snap.total_liquidity, snap.available_liquidity + snap.locked_collateral);
    }

    PoolConfig config_;
    std::unique_ptr<CollateralPool> pool_;
};

TEST_F(CollateralPoolTest, AddLiquidity_FirstDepositMintsOneSharePerSat) {
    auto result = pool_->add_liquidity("lp-a", COIN);

    ASSERT_TRUE(result);
    EXPECT_EQ(result.value, COIN);

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.total_liquidity, COIN);
    EXPECT_EQ(snap.available_liquidity, COIN);
    EXPECT_EQ(snap.total_shares, COIN);
    EXPECT_EQ(snap.provider_count, 1u);
    ExpectConserved();
}

TEST_F(CollateralPoolTest, AddLiquidity_RejectsZeroAndBelowMinimum) {
    auto zero = pool_->add_liquidity("lp-a", 0);
    EXPECT_EQ(zero.error, ErrorCode::INVALID_AMOUNT);

    auto small = pool_->add_liquidity("lp-a", 9999);
    EXPECT_EQ(small.error, ErrorCode::BELOW_MINIMUM_DEPOSIT);

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.total_liquidity, 0u);
    EXPECT_EQ(snap.total_shares, 0u);
    EXPECT_TRUE(pool_->history().empty());
}

TEST_F(CollateralPoolTest, AddLiquidity_LaterDepositorPaysForAccruedPremium) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->collect_premium("OPT-1", 1000000));

    auto second = pool_->add_liquidity("lp-b", COIN);
    ASSERT_TRUE(second);
    // 1e8 * 1e8 / 101e6
    EXPECT_EQ(second.value, 99009900u);

    auto a = pool_->provider("lp-a");
    auto b = pool_->provider("lp-b");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_GT(pool_->share_value(a->shares), pool_->share_value(b->shares));
    ExpectConserved();
}

TEST_F(CollateralPoolTest, RemoveLiquidity_ReturnsProportionalValue) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->collect_premium("OPT-1", 2000000));

    auto removed = pool_->remove_liquidity("lp-a", COIN / 2);
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed.value, 51000000u);

    auto lp = pool_->provider("lp-a");
    ASSERT_TRUE(lp.has_value());
    EXPECT_EQ(lp->shares, COIN / 2);
    EXPECT_EQ(lp->deposited_amount, COIN / 2);

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.total_liquidity, 51000000u);
    ExpectConserved();
}

TEST_F(CollateralPoolTest, RemoveLiquidity_RejectsMoreSharesThanHeld) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));

    auto removed = pool_->remove_liquidity("lp-a", COIN + 1);
    EXPECT_EQ(removed.error, ErrorCode::INSUFFICIENT_SHARES);

    auto unknown = pool_->remove_liquidity("nobody", 1);
    EXPECT_EQ(unknown.error, ErrorCode::INSUFFICIENT_SHARES);

    EXPECT_EQ(pool_->snapshot().total_liquidity, COIN);
}

TEST_F(CollateralPoolTest, RemoveLiquidity_CannotWithdrawLockedCollateral) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 60000000));

    auto removed = pool_->remove_liquidity("lp-a", COIN);
    EXPECT_EQ(removed.error, ErrorCode::INSUFFICIENT_AVAILABLE_LIQUIDITY);

    auto lp = pool_->provider("lp-a");
    ASSERT_TRUE(lp.has_value());
    EXPECT_EQ(lp->shares, COIN);
    EXPECT_EQ(pool_->snapshot().locked_collateral, 60000000u);
    ExpectConserved();
}

TEST_F(CollateralPoolTest, LockCollateral_MovesAvailableToLocked) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));

    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 10000000));

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.available_liquidity, 90000000u);
    EXPECT_EQ(snap.locked_collateral, 10000000u);
    EXPECT_EQ(snap.active_options, 1u);
    EXPECT_EQ(pool_->locked_for("OPT-1"), 10000000u);
    EXPECT_DOUBLE_EQ(pool_->utilization_rate(), 0.1);
    ExpectConserved();
}

TEST_F(CollateralPoolTest, LockCollateral_RejectsWhenAvailableIsShort) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", 5000000));

    auto status = pool_->lock_collateral("OPT-1", 10000000);
    EXPECT_EQ(status.error, ErrorCode::INSUFFICIENT_LIQUIDITY);

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.available_liquidity, 5000000u);
    EXPECT_EQ(snap.locked_collateral, 0u);
    EXPECT_EQ(snap.active_options, 0u);
}

TEST_F(CollateralPoolTest, LockCollateral_RejectsDuplicateContract) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 1000000));

    auto again = pool_->lock_collateral("OPT-1", 1000000);
    EXPECT_EQ(again.error, ErrorCode::DUPLICATE_CONTRACT);
    EXPECT_EQ(pool_->locked_for("OPT-1"), 1000000u);
}

TEST_F(CollateralPoolTest, ReleaseCollateral_PartialThenFull) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 1000000));

    ASSERT_TRUE(pool_->release_collateral("OPT-1", 400000));
    EXPECT_EQ(pool_->locked_for("OPT-1"), 600000u);
    EXPECT_EQ(pool_->snapshot().active_options, 1u);

    ASSERT_TRUE(pool_->release_collateral("OPT-1", 600000));
    EXPECT_EQ(pool_->locked_for("OPT-1"), 0u);

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.active_options, 0u);
    EXPECT_EQ(snap.available_liquidity, COIN);
    ExpectConserved();
}

TEST_F(CollateralPoolTest, ReleaseCollateral_RejectsOverRelease) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 1000000));

    auto over = pool_->release_collateral("OPT-1", 1000001);
    EXPECT_EQ(over.error, ErrorCode::INSUFFICIENT_LOCKED_COLLATERAL);

    auto unknown = pool_->release_collateral("OPT-2", 1);
    EXPECT_EQ(unknown.error, ErrorCode::CONTRACT_NOT_FOUND);

    EXPECT_EQ(pool_->locked_for("OPT-1"), 1000000u);
}

TEST_F(CollateralPoolTest, PayoutSettlement_PaysBuyerAndReleasesRemainder) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 10000000));
    ASSERT_TRUE(pool_->collect_premium("OPT-1", 250000));

    ASSERT_TRUE(pool_->payout_settlement("OPT-1", 666666, "bcrt1p-buyer"));

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.total_payout, 666666u);
    EXPECT_EQ(snap.total_liquidity, 99583334u);
    EXPECT_EQ(snap.available_liquidity, 99583334u);
    EXPECT_EQ(snap.locked_collateral, 0u);
    EXPECT_EQ(snap.active_options, 0u);
    EXPECT_EQ(snap.net_profit(), 250000 - 666666);
    EXPECT_EQ(pool_->locked_for("OPT-1"), 0u);
    ExpectConserved();

    auto events = pool_->history();
    ASSERT_GE(events.size(), 2u);
    EXPECT_EQ(events[events.size() - 2].type, PoolEventType::SETTLEMENT_PAYOUT);
    EXPECT_EQ(events[events.size() - 2].recipient, "bcrt1p-buyer");
    EXPECT_EQ(events.back().type, PoolEventType::COLLATERAL_RELEASED);
    EXPECT_EQ(events.back().amount, 10000000u - 666666u);
}

TEST_F(CollateralPoolTest, PayoutSettlement_RejectsPayoutAboveLock) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 1000000));

    auto status = pool_->payout_settlement("OPT-1", 1000001, "someone");
    EXPECT_EQ(status.error, ErrorCode::INSUFFICIENT_LOCKED_COLLATERAL);

    auto snap = pool_->snapshot();
    EXPECT_EQ(snap.total_payout, 0u);
    EXPECT_EQ(snap.locked_collateral, 1000000u);
}

TEST_F(CollateralPoolTest, ZeroAmounts_AreRejectedEverywhere) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));

    EXPECT_EQ(pool_->remove_liquidity("lp-a", 0).error, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(pool_->lock_collateral("OPT-1", 0).error, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(pool_->release_collateral("OPT-1", 0).error, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(pool_->payout_settlement("OPT-1", 0, "x").error, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(pool_->collect_premium("OPT-1", 0).error, ErrorCode::INVALID_AMOUNT);
}

TEST_F(CollateralPoolTest, AddLiquidity_SuspendedWhenPoolIsInsolvent) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", 1000000));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 1000000));
    ASSERT_TRUE(pool_->payout_settlement("OPT-1", 1000000, "buyer"));

    EXPECT_EQ(pool_->snapshot().total_liquidity, 0u);

    auto deposit = pool_->add_liquidity("lp-b", COIN);
    EXPECT_EQ(deposit.error, ErrorCode::POOL_INSOLVENT);
}

TEST_F(CollateralPoolTest, LpReturn_ReflectsPremiumIncome) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    EXPECT_DOUBLE_EQ(*pool_->lp_return("lp-a"), 0.0);

    ASSERT_TRUE(pool_->collect_premium("OPT-1", 5000000));
    EXPECT_NEAR(*pool_->lp_return("lp-a"), 0.05, 1e-9);

    EXPECT_FALSE(pool_->lp_return("nobody").has_value());
}

TEST_F(CollateralPoolTest, History_RecordsEventsInOrder) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 1000000));
    ASSERT_TRUE(pool_->collect_premium("OPT-1", 50000));
    ASSERT_TRUE(pool_->release_collateral("OPT-1", 1000000));

    auto events = pool_->history();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, PoolEventType::DEPOSIT);
    EXPECT_EQ(events[0].shares, COIN);
    EXPECT_EQ(events[1].type, PoolEventType::COLLATERAL_LOCKED);
    EXPECT_EQ(events[2].type, PoolEventType::PREMIUM_COLLECTED);
    EXPECT_EQ(events[3].type, PoolEventType::COLLATERAL_RELEASED);
    EXPECT_EQ(events[3].reference, "OPT-1");
}

TEST_F(CollateralPoolTest, History_StampsBlockHeight) {
    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN, 799000));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 10000000, 799100));
    ASSERT_TRUE(pool_->collect_premium("OPT-1", 250000, 799100));
    ASSERT_TRUE(pool_->payout_settlement("OPT-1", 666666, "bcrt1p-buyer", 800000));
    ASSERT_TRUE(pool_->remove_liquidity("lp-a", 1000000, 800010));

    auto events = pool_->history();
    ASSERT_EQ(events.size(), 6u);
    EXPECT_EQ(events[0].block_height, 799000u);
    EXPECT_EQ(events[1].block_height, 799100u);
    EXPECT_EQ(events[2].block_height, 799100u);
    EXPECT_EQ(events[3].type, PoolEventType::SETTLEMENT_PAYOUT);
    EXPECT_EQ(events[3].block_height, 800000u);
    EXPECT_EQ(events[4].type, PoolEventType::COLLATERAL_RELEASED);
    EXPECT_EQ(events[4].block_height, 800000u);
    EXPECT_EQ(events[5].type, PoolEventType::WITHDRAWAL);
    EXPECT_EQ(events[5].block_height, 800010u);
}

TEST_F(CollateralPoolTest, RiskMetrics_CombineDeltaAndProfit) {
    auto empty = pool_->risk_metrics();
    EXPECT_DOUBLE_EQ(empty.delta_ratio, 0.0);
    EXPECT_EQ(empty.net_profit, 0);

    ASSERT_TRUE(pool_->add_liquidity("lp-a", COIN));
    ASSERT_TRUE(pool_->lock_collateral("OPT-1", 10000000));
    ASSERT_TRUE(pool_->collect_premium("OPT-1", 250000));
    pool_->update_delta(0.6, -0.2);

    auto open = pool_->risk_metrics();
    EXPECT_NEAR(open.utilization_rate, 10000000.0 / 100250000.0, 1e-12);
    EXPECT_NEAR(open.net_delta, 0.4, 1e-12);
    EXPECT_NEAR(open.delta_ratio, 0.4 / 1.0025, 1e-12);
    EXPECT_EQ(open.net_profit, 250000);

    ASSERT_TRUE(pool_->payout_settlement("OPT-1", 666666, "bcrt1p-buyer"));
    pool_->update_delta(0.0, -0.5);

    auto settled = pool_->risk_metrics();
    EXPECT_DOUBLE_EQ(settled.utilization_rate, 0.0);
    EXPECT_NEAR(settled.delta_ratio, 0.5 / 0.99583334, 1e-12);
    EXPECT_EQ(settled.net_profit, -416666);
    EXPECT_NEAR(settled.net_profit_btc, -0.00416666, 1e-12);

    auto snap = pool_->snapshot();
    EXPECT_DOUBLE_EQ(snap.total_put_delta, -0.5);
    EXPECT_DOUBLE_EQ(snap.net_delta(), -0.5);
}
