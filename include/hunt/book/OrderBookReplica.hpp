#pragma once

#include "hunt/Result.hpp"
#include "hunt/book/Types.hpp"
#include "hunt/util/Metrics.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hunt {

// Local replica of one instrument's level-aggregated book, kept in sync with
// the exchange feed by snapshot + deltas and verified by the CRC32 checksum.
//
// Single writer: the stream listener applies updates and then reads the
// replica synchronously, so no lock is taken here.
class OrderBookReplica {
public:
    explicit OrderBookReplica(std::string instrument = {});

    const std::string& instrument() const { return instrument_; }

    // Replace both sides. A mismatching checksum flags the replica
    // inconsistent but the new state is still committed. A matching
    // snapshot restores consistency.
    void applySnapshot(const LevelUpdates& bids, const LevelUpdates& asks,
                       int64_t checksum, BookSeq seq = {});

    // Upsert / erase (size 0) levels. Returns the recomputed checksum, or an
    // error on mismatch or crossed book. Never rolls back.
    Result<uint32_t> applyDelta(const LevelUpdates& bids, const LevelUpdates& asks,
                                int64_t checksum, BookSeq seq = {});

    // ---- Top of book ----
    std::optional<PriceLevel> bestBid() const;
    std::optional<PriceLevel> bestAsk() const;
    double midPrice() const;
    double weightedMidPrice() const;
    double spread() const;
    double spreadBps() const;

    // ---- Depth ----
    std::vector<PriceLevel> bids(size_t n) const;
    std::vector<PriceLevel> asks(size_t n) const;
    double depth(Side side, size_t n) const;
    size_t levelCount(Side side) const { return side == Side::Bid ? bids_.size() : asks_.size(); }
    double levelSize(Side side, double price) const;

    void forEachLevel(Side side, size_t n,
                      const std::function<void(const PriceLevel&)>& fn) const;

    // ---- Integrity ----
    uint32_t checksum() const;
    std::string checksumPayload() const;
    uint32_t lastChecksum() const { return lastChecksum_; }
    bool consistent() const { return consistent_; }
    uint64_t sequence() const { return sequence_; }
    uint64_t updateCount() const { return updateCount_; }
    uint64_t errorCount() const { return errorCount_; }
    int64_t lastSeqId() const { return lastSeqId_; }
    bool crossed() const;

    // ---- Detection ----
    std::vector<PriceGap> detectLiquidityVoid(VoidDirection direction,
                                              double gapThreshold,
                                              size_t scanLevels) const;
    std::optional<WallHit> detectWall(double minDepth, size_t scanLevels) const;

    // "BTC-USDT-SWAP bid=... ask=... spread_bps=... levels=.../... ok"
    std::string summary() const;

    BookMetricsSnapshot metrics() const { return metrics_.snapshot(); }

    void clear();

private:
    struct Greater { bool operator()(double a, double b) const noexcept { return a > b; } };
    struct Less    { bool operator()(double a, double b) const noexcept { return a < b; } };
    using BidLadder = std::map<double, PriceLevel, Greater>;
    using AskLadder = std::map<double, PriceLevel, Less>;

    template <typename Ladder>
    static void upsert(Ladder& ladder, const LevelUpdate& u);

    void trackSeq(BookSeq seq);
    // Compare, flag, count; returns the recomputed checksum and whether it held.
    std::pair<uint32_t, bool> verify(int64_t expected, const char* kind);

    std::string instrument_;
    BidLadder   bids_;
    AskLadder   asks_;

    uint64_t sequence_     = 0;
    uint32_t lastChecksum_ = 0;
    uint64_t updateCount_  = 0;
    uint64_t errorCount_   = 0;
    bool     consistent_   = false;
    int64_t  lastSeqId_    = -1;

    BookMetrics metrics_;
};

} // namespace hunt
