#include "hunt/risk/RiskManager.hpp"
#include "hunt/util/Config.hpp"
#include <gtest/gtest.h>

using namespace hunt;

namespace {

Position position(const std::string& inst, double notional, double upl = 0.0) {
    Position p;
    p.instrument = inst;
    p.size = 1;
    p.notional = notional;
    p.unrealizedPnl = upl;
    return p;
}

class RiskManagerTest : public ::testing::Test {
protected:
    RiskManagerTest() { risk.updateMetrics({10000, 10000}, {}); }
    RiskManager risk;
};

} // namespace

TEST_F(RiskManagerTest, ApprovesOrderWithinLimits) {
    auto d = risk.preTradeCheck("BTC-USDT-SWAP", OrderSide::Buy, 1, 500);
    EXPECT_TRUE(d.approved);
    EXPECT_TRUE(static_cast<bool>(d));
    EXPECT_EQ(d.code, RejectReason::None);
    EXPECT_NEAR(d.kellySize, 2125.0, 1e-9);
    EXPECT_FALSE(d.aboveKelly);
}

TEST_F(RiskManagerTest, RejectsOversizedNotional) {
    auto d = risk.preTradeCheck("BTC-USDT-SWAP", OrderSide::Buy, 1, 2000);
    EXPECT_FALSE(d);
    EXPECT_EQ(d.code, RejectReason::PositionSize);
    EXPECT_STREQ(rejectReasonName(d.code), "position_size");
}

TEST_F(RiskManagerTest, RejectsInsufficientMargin) {
    risk.updateMetrics({10000, 10}, {});
    auto d = risk.preTradeCheck("BTC-USDT-SWAP", OrderSide::Buy, 1, 500);
    EXPECT_EQ(d.code, RejectReason::Margin);
}

TEST_F(RiskManagerTest, RejectsExcessLeverage) {
    risk.updateMetrics({10000, 10000}, {position("ETH-USDT-SWAP", 199800)});
    EXPECT_NEAR(risk.metrics().leverage, 19.98, 1e-9);
    auto d = risk.preTradeCheck("BTC-USDT-SWAP", OrderSide::Buy, 1, 500);
    EXPECT_EQ(d.code, RejectReason::Leverage);
}

TEST_F(RiskManagerTest, DailyLossHardStopLatchesEmergencyStop) {
    risk.updateMetrics({9400, 9400}, {});
    EXPECT_NEAR(risk.metrics().dailyLossRatio, -0.06, 1e-12);

    auto d = risk.preTradeCheck("BTC-USDT-SWAP", OrderSide::Buy, 1, 100);
    EXPECT_EQ(d.code, RejectReason::DailyLoss);
    EXPECT_TRUE(risk.emergencyStopped());

    d = risk.preTradeCheck("BTC-USDT-SWAP", OrderSide::Buy, 1, 100);
    EXPECT_EQ(d.code, RejectReason::EmergencyStop);
}

TEST_F(RiskManagerTest, BreakerGateIsCheckedFirst) {
    risk.enableEmergencyStop("test");
    risk.setBreakerGate([] { return false; });
    auto d = risk.preTradeCheck("BTC-USDT-SWAP", OrderSide::Buy, 1, 100);
    EXPECT_EQ(d.code, RejectReason::CircuitBreaker);
}

TEST_F(RiskManagerTest, ManualEmergencyStopAndRelease) {
    risk.enableEmergencyStop();
    EXPECT_EQ(risk.preTradeCheck("X", OrderSide::Sell, 1, 100).code, RejectReason::EmergencyStop);
    risk.disableEmergencyStop();
    EXPECT_TRUE(risk.preTradeCheck("X", OrderSide::Sell, 1, 100).approved);
}

TEST_F(RiskManagerTest, AboveKellyIsAdvisoryOnly) {
    RiskManager small;
    small.updateMetrics({1000, 1000}, {});
    auto d = small.preTradeCheck("BTC-USDT-SWAP", OrderSide::Buy, 1, 500);
    EXPECT_TRUE(d.approved);
    EXPECT_TRUE(d.aboveKelly);
    EXPECT_NEAR(small.kellySize(), 212.5, 1e-9);
}

TEST_F(RiskManagerTest, KellyClampsToZeroForLosingEdge) {
    RiskLimits l;
    l.kellyWinRate = 0.3;
    RiskManager r(l);
    r.updateMetrics({10000, 10000}, {});
    EXPECT_DOUBLE_EQ(r.kellySize(), 0.0);
}

TEST_F(RiskManagerTest, CheckSignalUsesPriceAndSize) {
    Signal s;
    s.strategy = "front_running";
    s.instrument = "BTC-USDT-SWAP";
    s.action = SignalAction::Sell;
    s.price = 100;
    s.size = 20;
    EXPECT_EQ(risk.check(s).code, RejectReason::PositionSize);
    s.size = 2;
    EXPECT_TRUE(risk.check(s).approved);
}

TEST_F(RiskManagerTest, MetricsFromBalanceAndPositions) {
    risk.updateMetrics({10500, 8000}, {position("A", 1000, 20), position("B", -500, -5)});
    const auto m = risk.metrics();
    EXPECT_DOUBLE_EQ(m.totalPositionValue, 1500);
    EXPECT_DOUBLE_EQ(m.unrealizedPnl, 15);
    EXPECT_DOUBLE_EQ(m.dailyPnl, 500);
    EXPECT_DOUBLE_EQ(m.dailyLossRatio, 0.05);
    EXPECT_DOUBLE_EQ(m.availableBalance, 8000);
}

TEST_F(RiskManagerTest, PostTradeClassifiesWinsAndLosses) {
    risk.postTradeCheck({"A", 10.0});
    risk.postTradeCheck({"A", -4.0});
    risk.postTradeCheck({"A", 0.0});
    risk.postTradeCheck({"A", std::nullopt});

    const auto s = risk.summary();
    EXPECT_EQ(s.totalTrades, 4u);
    EXPECT_EQ(s.winningTrades, 1u);
    EXPECT_EQ(s.losingTrades, 2u);
    EXPECT_DOUBLE_EQ(s.winRate, 0.25);
}

TEST_F(RiskManagerTest, CheckEmergencyStopFromMetrics) {
    EXPECT_FALSE(risk.checkEmergencyStop());
    risk.updateMetrics({9000, 9000}, {});
    EXPECT_TRUE(risk.checkEmergencyStop());
    EXPECT_TRUE(risk.summary().emergencyStop);
}

TEST_F(RiskManagerTest, ResetDailyRebasesLoss) {
    risk.updateMetrics({9400, 9400}, {});
    risk.resetDaily();
    EXPECT_DOUBLE_EQ(risk.metrics().dailyLossRatio, 0.0);
    EXPECT_DOUBLE_EQ(risk.summary().dailyStartBalance, 9400);
    EXPECT_TRUE(risk.preTradeCheck("X", OrderSide::Buy, 1, 100).approved);
}

TEST(RiskLimitsTest, FromConfig) {
    util::Config cfg;
    cfg.maxPositionSize = 250;
    cfg.leverageLimit = 5;
    const auto l = RiskLimits::fromConfig(cfg);
    EXPECT_DOUBLE_EQ(l.maxPositionSize, 250);
    EXPECT_DOUBLE_EQ(l.leverageLimit, 5);
    EXPECT_DOUBLE_EQ(l.maxDailyLoss, 0.05);
}
