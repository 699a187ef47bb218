#include "hunt/book/Checksum.hpp"
#include "hunt/book/OrderBookReplica.hpp"
#include <gtest/gtest.h>

using namespace hunt;

namespace {

// Checksum the exchange would send for these levels.
int64_t wireFor(const LevelUpdates& bids, const LevelUpdates& asks) {
    std::vector<std::pair<double, double>> b, a;
    for (const auto& u : bids) if (u.size > 0) b.emplace_back(u.price, u.size);
    for (const auto& u : asks) if (u.size > 0) a.emplace_back(u.price, u.size);
    return static_cast<int32_t>(bookChecksum(b, a));
}

// OrderBookReplica holds atomic counters and cannot be copied or moved, so
// the scenario is applied to a caller-owned replica.
void scenarioA(OrderBookReplica& book) {
    book.applySnapshot({{100, 5, 1}, {99, 3, 1}}, {{101, 2, 1}}, -2009969321);
}

} // namespace

// ===================== Snapshot =====================

TEST(OrderBookReplicaTest, ScenarioATopOfBook) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    ASSERT_TRUE(book.consistent());

    auto bb = book.bestBid();
    auto ba = book.bestAsk();
    ASSERT_TRUE(bb.has_value());
    ASSERT_TRUE(ba.has_value());
    EXPECT_DOUBLE_EQ(bb->price, 100);
    EXPECT_DOUBLE_EQ(bb->size, 5);
    EXPECT_DOUBLE_EQ(ba->price, 101);
    EXPECT_DOUBLE_EQ(ba->size, 2);
    EXPECT_DOUBLE_EQ(book.midPrice(), 100.5);
    EXPECT_DOUBLE_EQ(book.spread(), 1.0);
    EXPECT_NEAR(book.spreadBps(), 99.5, 0.01);
    EXPECT_EQ(book.lastChecksum(), 2284997975u);
    EXPECT_EQ(book.checksum(), book.lastChecksum());
}

TEST(OrderBookReplicaTest, NewReplicaIsNotConsistent) {
    OrderBookReplica book("X");
    EXPECT_FALSE(book.consistent());
    EXPECT_FALSE(book.bestBid().has_value());
    EXPECT_DOUBLE_EQ(book.midPrice(), 0.0);
    EXPECT_DOUBLE_EQ(book.spreadBps(), 0.0);
}

TEST(OrderBookReplicaTest, SnapshotOmitsZeroSizeLevels) {
    OrderBookReplica book("X");
    LevelUpdates bids{{100, 5, 1}, {99, 0, 0}};
    LevelUpdates asks{{101, 2, 1}};
    book.applySnapshot(bids, asks, wireFor(bids, asks));
    EXPECT_EQ(book.levelCount(Side::Bid), 1u);
    EXPECT_TRUE(book.consistent());
}

TEST(OrderBookReplicaTest, SnapshotMismatchCommitsButFlags) {
    OrderBookReplica book("X");
    book.applySnapshot({{100, 5, 1}}, {{101, 2, 1}}, 12345);
    EXPECT_FALSE(book.consistent());
    EXPECT_EQ(book.errorCount(), 1u);
    ASSERT_TRUE(book.bestBid().has_value());
    EXPECT_DOUBLE_EQ(book.bestBid()->price, 100);
}

TEST(OrderBookReplicaTest, MatchingSnapshotRestoresConsistency) {
    OrderBookReplica book("X");
    book.applySnapshot({{100, 5, 1}}, {{101, 2, 1}}, 1);
    ASSERT_FALSE(book.consistent());

    book.applySnapshot({{100, 5, 1}, {99, 3, 1}}, {{101, 2, 1}}, -2009969321);
    EXPECT_TRUE(book.consistent());
    EXPECT_EQ(book.errorCount(), 1u);
}

TEST(OrderBookReplicaTest, SnapshotIsIdempotent) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    const std::string before = book.checksumPayload();
    book.applySnapshot({{100, 5, 1}, {99, 3, 1}}, {{101, 2, 1}}, -2009969321);
    EXPECT_EQ(book.checksumPayload(), before);
    EXPECT_TRUE(book.consistent());
    EXPECT_EQ(book.levelCount(Side::Bid), 2u);
    EXPECT_EQ(book.levelCount(Side::Ask), 1u);
}

// ===================== Delta =====================

TEST(OrderBookReplicaTest, DeltaRemovesLevelWithZeroSize) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    auto r = book.applyDelta({{99, 0, 0}}, {}, -353270106);
    ASSERT_TRUE(r.has_value()) << r.error().describe();
    EXPECT_EQ(*r, 3941697190u);
    EXPECT_EQ(book.levelCount(Side::Bid), 1u);
    EXPECT_DOUBLE_EQ(book.levelSize(Side::Bid, 99), 0.0);
    EXPECT_TRUE(book.consistent());
}

TEST(OrderBookReplicaTest, DeleteThenRestoreReturnsToOriginalChecksum) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    const uint32_t original = book.checksum();

    ASSERT_TRUE(book.applyDelta({{99, 0, 0}}, {}, -353270106).has_value());
    auto r = book.applyDelta({{99, 3, 1}}, {}, -2009969321);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, original);
}

TEST(OrderBookReplicaTest, DeltaRemovingAbsentPriceIsNoOp) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    auto r = book.applyDelta({{42, 0, 0}}, {}, -2009969321);
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(book.levelCount(Side::Bid), 2u);
}

TEST(OrderBookReplicaTest, ScenarioEMismatchFlagsAndCommits) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    const uint64_t errorsBefore = book.errorCount();

    auto r = book.applyDelta({{100, 7, 2}}, {}, 999);
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().message.find("checksum mismatch"), std::string::npos);
    EXPECT_EQ(r.error().path, "BTC-USDT-SWAP");
    EXPECT_FALSE(book.consistent());
    EXPECT_EQ(book.errorCount(), errorsBefore + 1);
    EXPECT_DOUBLE_EQ(book.bestBid()->size, 7);
}

TEST(OrderBookReplicaTest, ValidDeltaDoesNotRestoreConsistency) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    ASSERT_FALSE(book.applyDelta({{100, 7, 2}}, {}, 999).has_value());

    LevelUpdates bids{{100, 7, 2}, {99, 3, 1}};
    LevelUpdates asks{{101, 2, 1}};
    auto r = book.applyDelta({}, {}, wireFor(bids, asks));
    EXPECT_TRUE(r.has_value());
    EXPECT_FALSE(book.consistent());
}

TEST(OrderBookReplicaTest, CrossedDeltaIsRejected) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    LevelUpdates bids{{102, 1, 1}, {100, 5, 1}, {99, 3, 1}};
    LevelUpdates asks{{101, 2, 1}};
    auto r = book.applyDelta({{102, 1, 1}}, {}, wireFor(bids, asks));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "crossed book after delta");
    EXPECT_FALSE(book.consistent());
    EXPECT_EQ(book.errorCount(), 1u);
    EXPECT_EQ(book.metrics().crossedBooks, 1u);
}

TEST(OrderBookReplicaTest, ConsistentBookNeverCrossed) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    for (int i = 0; i < 20; ++i) {
        LevelUpdates bids{{100, 5.0 + i, 1}, {99, 3, 1}};
        LevelUpdates asks{{101, 2, 1}};
        auto r = book.applyDelta({{100, 5.0 + i, 1}}, {}, wireFor(bids, asks));
        ASSERT_TRUE(r.has_value());
        ASSERT_TRUE(book.consistent());
        EXPECT_LT(book.bestBid()->price, book.bestAsk()->price);
    }
    EXPECT_EQ(book.updateCount(), 21u);
    EXPECT_EQ(book.sequence(), 21u);
}

TEST(OrderBookReplicaTest, SequenceGapIsCountedNotFatal) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    ASSERT_TRUE(book.applyDelta({}, {}, -2009969321, BookSeq{10, 9}).has_value());
    ASSERT_TRUE(book.applyDelta({}, {}, -2009969321, BookSeq{12, 11}).has_value());
    EXPECT_EQ(book.metrics().seqGaps, 1u);
    EXPECT_EQ(book.lastSeqId(), 12);
    EXPECT_TRUE(book.consistent());
}

// ===================== Queries =====================

TEST(OrderBookReplicaTest, WeightedMidLeansTowardThinSide) {
    OrderBookReplica book("X");
    LevelUpdates bids{{100, 9, 1}};
    LevelUpdates asks{{101, 1, 1}};
    book.applySnapshot(bids, asks, wireFor(bids, asks));
    // (100*1 + 101*9) / 10
    EXPECT_DOUBLE_EQ(book.weightedMidPrice(), 100.9);
}

TEST(OrderBookReplicaTest, OneSidedBookFallsBack) {
    OrderBookReplica book("X");
    LevelUpdates bids{{100, 9, 1}};
    book.applySnapshot(bids, {}, wireFor(bids, {}));
    EXPECT_DOUBLE_EQ(book.midPrice(), 100);
    EXPECT_DOUBLE_EQ(book.weightedMidPrice(), 100);
    EXPECT_DOUBLE_EQ(book.spread(), 0.0);
    EXPECT_FALSE(book.crossed());
}

TEST(OrderBookReplicaTest, DepthSumsTopLevels) {
    OrderBookReplica book("X");
    LevelUpdates bids{{100, 1, 1}, {99, 2, 1}, {98, 3, 1}, {97, 4, 1}, {96, 5, 1}, {95, 6, 1}};
    LevelUpdates asks{{101, 1, 1}};
    book.applySnapshot(bids, asks, wireFor(bids, asks));
    EXPECT_DOUBLE_EQ(book.depth(Side::Bid, 5), 15);
    EXPECT_DOUBLE_EQ(book.depth(Side::Bid, 100), 21);
    ASSERT_EQ(book.bids(2).size(), 2u);
    EXPECT_DOUBLE_EQ(book.bids(2)[1].price, 99);
}

TEST(OrderBookReplicaTest, LiquidityVoidAboveAndBelow) {
    OrderBookReplica book("X");
    LevelUpdates bids{{100, 1, 1}, {99.9, 1, 1}, {98, 1, 1}};
    LevelUpdates asks{{100.1, 1, 1}, {100.2, 1, 1}, {103, 1, 1}};
    book.applySnapshot(bids, asks, wireFor(bids, asks));

    auto above = book.detectLiquidityVoid(VoidDirection::Above, 0.002, 50);
    ASSERT_EQ(above.size(), 1u);
    EXPECT_DOUBLE_EQ(above[0].first, 100.2);
    EXPECT_DOUBLE_EQ(above[0].second, 103);

    auto below = book.detectLiquidityVoid(VoidDirection::Below, 0.002, 50);
    ASSERT_EQ(below.size(), 1u);
    EXPECT_DOUBLE_EQ(below[0].first, 98);
    EXPECT_DOUBLE_EQ(below[0].second, 99.9);

    EXPECT_EQ(book.detectLiquidityVoid(VoidDirection::Both, 0.002, 50).size(), 2u);
}

TEST(OrderBookReplicaTest, WallDetectionPrefersBids) {
    OrderBookReplica book("X");
    LevelUpdates bids{{100, 1, 1}, {99, 80, 1}};
    LevelUpdates asks{{101, 200, 1}};
    book.applySnapshot(bids, asks, wireFor(bids, asks));

    auto wall = book.detectWall(50, 20);
    ASSERT_TRUE(wall.has_value());
    EXPECT_EQ(wall->side, Side::Bid);
    EXPECT_DOUBLE_EQ(wall->price, 99);

    auto askWall = book.detectWall(100, 20);
    ASSERT_TRUE(askWall.has_value());
    EXPECT_EQ(askWall->side, Side::Ask);

    EXPECT_FALSE(book.detectWall(500, 20).has_value());
}

TEST(OrderBookReplicaTest, SummaryMentionsState) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    const std::string s = book.summary();
    EXPECT_NE(s.find("BTC-USDT-SWAP"), std::string::npos);
    EXPECT_NE(s.find(" ok"), std::string::npos);
}

TEST(OrderBookReplicaTest, ClearResetsLevelsAndTrust) {
    OrderBookReplica book("BTC-USDT-SWAP");
    scenarioA(book);
    book.clear();
    EXPECT_FALSE(book.consistent());
    EXPECT_EQ(book.levelCount(Side::Bid), 0u);
    EXPECT_EQ(book.checksum(), 0u);
}
