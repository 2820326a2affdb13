#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "cost_model.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"

using backtester::CostModel;
using backtester::CostModelConfig;
using core::Decimal;
using core::OrderSide;
using test_helpers::D;
using test_helpers::makeBar;

class CostModelTest : public ::testing::Test {
protected:
    CostModel model;
    // $2,000,000 average dollar volume, 48,000 shares traded on the bar
    core::Bar liquid_bar = makeBar("AAPL", "2024-03-04", "151.50", "152.40", "150.90", "152.00", 48000);
    Decimal liquid_avg = D("2000000");
};

// ===========================================================================
// Reference scenarios
// ===========================================================================

TEST_F(CostModelTest, LiquidSmallMarketBuy) {
    Decimal slippage = model.slippage(liquid_bar, OrderSide::Buy, 100, liquid_avg);
    EXPECT_EQ(slippage, D("0.0303"));
    EXPECT_EQ(CostModel::applySlippage(liquid_bar.open, slippage, OrderSide::Buy), D("151.5303"));
    EXPECT_EQ(model.commission(100), D("0.50"));
}

TEST_F(CostModelTest, LargeOrderAddsMarketImpact) {
    // 25,000 shares is ~52% of the bar: 4 whole 10% steps past the 10% threshold
    EXPECT_EQ(model.impactIncrements(25000, 48000), 4);
    EXPECT_EQ(model.slippageRate(liquid_bar, 25000, liquid_avg), D("0.0006"));

    Decimal slippage = model.slippage(liquid_bar, OrderSide::Buy, 25000, liquid_avg);
    EXPECT_EQ(slippage, D("0.0909"));
    EXPECT_EQ(slippage.toString(2), "0.09");
    Decimal fill = CostModel::applySlippage(liquid_bar.open, slippage, OrderSide::Buy);
    EXPECT_EQ(fill, D("151.5909"));
    EXPECT_EQ(fill.toString(2), "151.59");
}

TEST_F(CostModelTest, IlliquidBaseRate) {
    EXPECT_EQ(model.slippageRate(liquid_bar, 100, D("999999.99")), D("0.0005"));
    EXPECT_EQ(model.slippageRate(liquid_bar, 100, D("1000000")), D("0.0002"));
}

TEST_F(CostModelTest, ZeroVolumeBarIsIlliquidPlusPenalty) {
    core::Bar dead = makeBar("AAPL", "2024-03-04", "100", "100", "100", "100", 0);
    EXPECT_EQ(model.slippageRate(dead, 100, liquid_avg), D("0.0010"));
    EXPECT_EQ(model.slippage(dead, OrderSide::Buy, 100, liquid_avg), D("0.10"));
    EXPECT_EQ(model.impactIncrements(100, 0), 0);
}

TEST_F(CostModelTest, SellSlippageMovesPriceDown) {
    Decimal slippage = model.slippage(liquid_bar, OrderSide::Sell, 100, liquid_avg);
    EXPECT_EQ(CostModel::applySlippage(liquid_bar.open, slippage, OrderSide::Sell), D("151.4697"));
}

// ===========================================================================
// Properties
// ===========================================================================

TEST_F(CostModelTest, CommissionIsLinear) {
    for (long long q : {1LL, 7LL, 100LL, 2500LL, 123457LL}) {
        EXPECT_EQ(model.commission(2 * q), model.commission(q) * Decimal(2)) << "q=" << q;
    }
    EXPECT_EQ(CostModel::commission(1000, Decimal()), Decimal());
}

TEST_F(CostModelTest, SlippageNonDecreasingInQuantity) {
    Decimal previous;
    for (long long q = 100; q <= 200000; q += 1700) {
        Decimal current = model.slippage(liquid_bar, OrderSide::Buy, q, liquid_avg);
        EXPECT_GE(current, previous) << "q=" << q;
        previous = current;
    }
}

// ===========================================================================
// Configuration
// ===========================================================================

TEST(CostModelConfigTest, FromJsonOverridesDefaults) {
    auto config = CostModelConfig::fromJson(nlohmann::json{{"commission_per_share", "0.01"},
                                                           {"liquid_slippage_rate", 0.0001}});
    EXPECT_EQ(config.commission_per_share, D("0.01"));
    EXPECT_EQ(config.liquid_slippage_rate, D("0.0001"));
    EXPECT_EQ(config.illiquid_slippage_rate, D("0.0005"));
}

TEST(CostModelConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(CostModelConfig::fromJson(nlohmann::json{{"liquid_slippage_rate", "-0.1"}}), core::ConfigException);
    EXPECT_THROW(CostModelConfig::fromJson(nlohmann::json{{"impact_step_ratio", "0"}}), core::ConfigException);
    EXPECT_THROW(CostModelConfig::fromJson(nlohmann::json{{"commission_per_share", true}}), core::ConfigException);
    EXPECT_THROW(CostModelConfig::fromJson(nlohmann::json::array()), core::ConfigException);
}
