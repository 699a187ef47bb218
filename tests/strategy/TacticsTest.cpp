#include "hunt/book/Checksum.hpp"
#include "hunt/strategy/Tactics.hpp"
#include <gtest/gtest.h>
#include <chrono>

using namespace hunt;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

const std::string kInst = "BTC-USDT-SWAP";

class TacticsTest : public ::testing::Test {
protected:
    TacticsTest() : book(kInst), tape(100), fx(kInst, book, tape) {}

    void load(const LevelUpdates& bids, const LevelUpdates& asks) {
        std::vector<std::pair<double, double>> b, a;
        for (const auto& u : bids) b.emplace_back(u.price, u.size);
        for (const auto& u : asks) a.emplace_back(u.price, u.size);
        book.applySnapshot(bids, asks, static_cast<int64_t>(bookChecksum(b, a)));
    }

    TacticContext at(TimePoint now) const { return TacticContext{kInst, book, fx, now}; }

    static TradeEvent trade(double size, TradeSide side) {
        TradeEvent t;
        t.instrument = kInst;
        t.price = 100;
        t.size = size;
        t.side = side;
        return t;
    }

    OrderBookReplica book;
    TradeTape tape;
    FeatureExtractor fx;
    const TimePoint t0 = Clock::now();
};

} // namespace

// ===================== Wall-riding =====================

TEST_F(TacticsTest, ScenarioBWallRideOnlyAfterPersistence) {
    WallRiding wr;
    load({{100, 5, 1}, {99, 150, 3}}, {{101, 5, 1}});

    // first sighting at t0, then one sample per second
    for (int k = 0; k < 5; ++k) {
        EXPECT_FALSE(wr.onOrderBook(at(t0 + seconds(k))).has_value()) << "sample " << k;
    }
    auto sig = wr.onOrderBook(at(t0 + seconds(5)));
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->strategy, "wall_riding");
    EXPECT_EQ(sig->action, SignalAction::Buy);
    EXPECT_EQ(sig->type, OrderType::Limit);
    EXPECT_NEAR(sig->price, 99.1, 1e-9);
    EXPECT_DOUBLE_EQ(sig->confidence, 0.7);

    EXPECT_TRUE(wr.onOrderBook(at(t0 + seconds(6))).has_value());
}

TEST_F(TacticsTest, WallForgottenAfterAbsence) {
    WallRiding wr;
    load({{100, 5, 1}, {99, 150, 3}}, {{101, 5, 1}});
    wr.onOrderBook(at(t0));
    ASSERT_EQ(wr.walls(kInst).size(), 1u);

    load({{100, 5, 1}, {99, 20, 3}}, {{101, 5, 1}});
    wr.onOrderBook(at(t0 + seconds(1)));
    EXPECT_EQ(wr.walls(kInst).size(), 1u);

    wr.onOrderBook(at(t0 + seconds(3)));
    EXPECT_TRUE(wr.walls(kInst).empty());
    EXPECT_FALSE(wr.canRideWall(kInst, t0 + seconds(10)).has_value());
}

TEST_F(TacticsTest, ReturningWallStartsOverAfterGap) {
    WallRiding wr;
    load({{100, 5, 1}, {99, 150, 3}}, {{101, 5, 1}});
    wr.onOrderBook(at(t0));

    load({{100, 5, 1}}, {{101, 5, 1}});
    wr.onOrderBook(at(t0 + seconds(3)));

    load({{100, 5, 1}, {99, 150, 3}}, {{101, 5, 1}});
    EXPECT_FALSE(wr.onOrderBook(at(t0 + seconds(6))).has_value());
    EXPECT_TRUE(wr.onOrderBook(at(t0 + seconds(11))).has_value());
}

TEST_F(TacticsTest, HighestTrustedWallWins) {
    WallRiding wr;
    load({{100, 5, 1}, {99, 150, 3}, {98, 300, 3}}, {{101, 5, 1}});
    auto sig = [&] {
        std::optional<Signal> last;
        for (int k = 0; k <= 5; ++k) last = wr.onOrderBook(at(t0 + seconds(k)));
        return last;
    }();
    ASSERT_TRUE(sig.has_value());
    EXPECT_NEAR(sig->price, 99.1, 1e-9);
    ASSERT_EQ(wr.walls(kInst).size(), 2u);
    EXPECT_DOUBLE_EQ(wr.walls(kInst)[0].price, 99);
}

TEST_F(TacticsTest, AskSideSizeIsNotAWall) {
    WallRiding wr;
    load({{100, 5, 1}}, {{101, 500, 1}});
    for (int k = 0; k <= 6; ++k) EXPECT_FALSE(wr.onOrderBook(at(t0 + seconds(k))).has_value());
}

// ===================== Front-running =====================

TEST_F(TacticsTest, FrontRunSellsWhenBidDepthCollapsesUnderLargeSell) {
    FrontRunning fr;
    load({{100, 60, 1}, {99, 40, 1}}, {{101, 50, 1}});
    for (int k = 0; k < 3; ++k) fx.update(t0 + milliseconds(100 * k));

    load({{100, 25, 1}, {99, 15, 1}}, {{101, 50, 1}});
    fx.update(t0 + milliseconds(300));

    auto sig = fr.onTrade(at(t0 + milliseconds(300)), trade(15, TradeSide::Sell));
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->strategy, "front_running");
    EXPECT_EQ(sig->action, SignalAction::Sell);
    EXPECT_EQ(sig->type, OrderType::Market);
    EXPECT_DOUBLE_EQ(sig->price, 100);
    EXPECT_DOUBLE_EQ(sig->confidence, 0.6);
    EXPECT_DOUBLE_EQ(sig->size, 0.01);
}

TEST_F(TacticsTest, FrontRunBuysWhenAskDepthCollapsesUnderLargeBuy) {
    FrontRunning fr;
    load({{100, 50, 1}}, {{101, 80, 1}});
    fx.update(t0);
    load({{100, 50, 1}}, {{101, 20, 1}});

    auto sig = fr.onTrade(at(t0 + milliseconds(50)), trade(12, TradeSide::Buy));
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->action, SignalAction::Buy);
    EXPECT_DOUBLE_EQ(sig->price, 101);
}

TEST_F(TacticsTest, SmallTradeIsIgnored) {
    FrontRunning fr;
    load({{100, 100, 1}}, {{101, 50, 1}});
    fx.update(t0);
    load({{100, 10, 1}}, {{101, 50, 1}});
    EXPECT_FALSE(fr.onTrade(at(t0), trade(5, TradeSide::Sell)).has_value());
}

TEST_F(TacticsTest, StableDepthDoesNotFrontRun) {
    FrontRunning fr;
    load({{100, 100, 1}}, {{101, 50, 1}});
    fx.update(t0);
    fx.update(t0 + milliseconds(100));
    EXPECT_FALSE(fr.onTrade(at(t0), trade(50, TradeSide::Sell)).has_value());
}

TEST_F(TacticsTest, DepthDropThreshold) {
    FrontRunning fr;
    EXPECT_TRUE(fr.checkDepthDrop(50, 100));
    EXPECT_FALSE(fr.checkDepthDrop(51, 100));
    EXPECT_FALSE(fr.checkDepthDrop(0, 0));
}

// ===================== Spread-capturing =====================

TEST_F(TacticsTest, QuotesBothSidesInsideBand) {
    SpreadCapturing sc;
    load({{100, 5, 1}}, {{101, 2, 1}});   // ~99.5 bps
    auto sig = sc.onOrderBook(at(t0));
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->action, SignalAction::MarketMake);
    EXPECT_EQ(sig->type, OrderType::Limit);
    EXPECT_DOUBLE_EQ(sig->price, 100);
    EXPECT_DOUBLE_EQ(sig->counterPrice, 101);
    EXPECT_DOUBLE_EQ(sig->confidence, 0.8);
}

TEST_F(TacticsTest, NoQuoteOutsideBand) {
    SpreadCapturing sc;
    load({{1000, 5, 1}}, {{1001, 2, 1}});   // ~10 bps
    EXPECT_FALSE(sc.onOrderBook(at(t0)).has_value());
    load({{100, 5, 1}}, {{103, 2, 1}});     // ~296 bps
    EXPECT_FALSE(sc.onOrderBook(at(t0)).has_value());
}

TEST_F(TacticsTest, NoQuoteOnOneSidedBook) {
    SpreadCapturing sc;
    load({{100, 5, 1}}, {});
    EXPECT_FALSE(sc.onOrderBook(at(t0)).has_value());
}
