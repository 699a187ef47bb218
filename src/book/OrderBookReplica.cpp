#include "hunt/book/OrderBookReplica.hpp"
#include "hunt/book/Checksum.hpp"
#include "hunt/util/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>

namespace hunt {

using util::LogLevel;
using util::logger;

namespace {

template <typename Ladder>
std::vector<std::pair<double, double>> topPairs(const Ladder& ladder, size_t n) {
    std::vector<std::pair<double, double>> out;
    out.reserve(std::min(n, ladder.size()));
    for (const auto& kv : ladder) {
        if (out.size() == n) break;
        out.emplace_back(kv.second.price, kv.second.size);
    }
    return out;
}

template <typename Ladder>
std::vector<PriceLevel> topLevels(const Ladder& ladder, size_t n) {
    std::vector<PriceLevel> out;
    out.reserve(std::min(n, ladder.size()));
    for (const auto& kv : ladder) {
        if (out.size() == n) break;
        out.push_back(kv.second);
    }
    return out;
}

template <typename Ladder>
double sumTop(const Ladder& ladder, size_t n) {
    double total = 0.0;
    size_t i = 0;
    for (const auto& kv : ladder) {
        if (i++ == n) break;
        total += kv.second.size;
    }
    return total;
}

// Gaps between consecutive levels; `distance` is the signed price step
// in the direction of travel away from the touch.
template <typename Ladder, typename Distance>
void scanGaps(const Ladder& ladder, size_t scanLevels, double threshold,
              Distance distance, std::vector<PriceGap>& out) {
    if (ladder.size() < 2) return;
    auto cur = ladder.begin();
    auto nxt = std::next(cur);
    for (size_t i = 0; nxt != ladder.end() && i + 1 < scanLevels; ++i, ++cur, ++nxt) {
        const double p = cur->first;
        if (p <= 0.0) continue;
        if (distance(p, nxt->first) / p > threshold) {
            out.emplace_back(std::min(p, nxt->first), std::max(p, nxt->first));
        }
    }
}

} // namespace

OrderBookReplica::OrderBookReplica(std::string instrument)
    : instrument_(std::move(instrument)) {}

// --------- Mutations ---------
template <typename Ladder>
void OrderBookReplica::upsert(Ladder& ladder, const LevelUpdate& u) {
    if (u.size <= 0.0) {
        ladder.erase(u.price);
        return;
    }
    PriceLevel& lvl = ladder[u.price];
    lvl.price      = u.price;
    lvl.size       = u.size;
    lvl.orderCount = u.orderCount;
}

void OrderBookReplica::applySnapshot(const LevelUpdates& bids, const LevelUpdates& asks,
                                     int64_t checksum, BookSeq seq) {
    bids_.clear();
    asks_.clear();
    for (const auto& u : bids) upsert(bids_, u);
    for (const auto& u : asks) upsert(asks_, u);

    ++sequence_;
    ++updateCount_;
    metrics_.incSnapshots();
    metrics_.addLevelsTouched(bids.size() + asks.size());
    lastSeqId_ = seq.seqId;

    const auto [computed, ok] = verify(checksum, "snapshot");
    if (ok) {
        consistent_ = true;
        lastChecksum_ = computed;
    }
    logger().log(LogLevel::Debug, "book.snapshot",
                 { {"inst", instrument_},
                   {"bids", std::to_string(bids_.size())},
                   {"asks", std::to_string(asks_.size())},
                   {"ok", ok ? "1" : "0"} });
}

Result<uint32_t> OrderBookReplica::applyDelta(const LevelUpdates& bids, const LevelUpdates& asks,
                                              int64_t checksum, BookSeq seq) {
    trackSeq(seq);
    for (const auto& u : bids) upsert(bids_, u);
    for (const auto& u : asks) upsert(asks_, u);

    ++sequence_;
    ++updateCount_;
    metrics_.incDeltas();
    metrics_.addLevelsTouched(bids.size() + asks.size());

    const auto [computed, ok] = verify(checksum, "delta");
    if (!ok) {
        std::ostringstream oss;
        if (crossed()) {
            oss << "crossed book after delta";
        } else {
            oss << "checksum mismatch: expected " << wireChecksum(checksum)
                << " computed " << computed;
        }
        return Error{ oss.str(), instrument_ };
    }
    lastChecksum_ = computed;
    return computed;
}

void OrderBookReplica::trackSeq(BookSeq seq) {
    if (seq.seqId < 0) return;
    // prevSeqId == -1 marks a restart of the sequence on the exchange side
    if (lastSeqId_ >= 0 && seq.prevSeqId >= 0 && seq.prevSeqId != lastSeqId_) {
        metrics_.incSeqGap();
        logger().log(LogLevel::Warn, "book.seq_gap",
                     { {"inst", instrument_},
                       {"expected_prev", std::to_string(lastSeqId_)},
                       {"got_prev", std::to_string(seq.prevSeqId)} });
    }
    lastSeqId_ = seq.seqId;
}

std::pair<uint32_t, bool> OrderBookReplica::verify(int64_t expected, const char* kind) {
    const uint32_t computed = checksum();
    const uint32_t want = wireChecksum(expected);
    const bool isCrossed = crossed();
    const bool match = computed == want;

    if (match && !isCrossed) return { computed, true };

    consistent_ = false;
    ++errorCount_;
    if (!match) {
        metrics_.incChecksumFailures();
        logger().log(LogLevel::Warn, "book.checksum_mismatch",
                     { {"inst", instrument_}, {"kind", kind},
                       {"expected", std::to_string(want)},
                       {"computed", std::to_string(computed)} });
    }
    if (isCrossed) {
        metrics_.incCrossedBooks();
        logger().log(LogLevel::Warn, "book.crossed",
                     { {"inst", instrument_}, {"kind", kind},
                       {"bid", util::fmt(bids_.begin()->first)},
                       {"ask", util::fmt(asks_.begin()->first)} });
    }
    return { computed, false };
}

void OrderBookReplica::clear() {
    bids_.clear();
    asks_.clear();
    consistent_ = false;
    lastChecksum_ = 0;
    lastSeqId_ = -1;
}

// --------- Top of book ---------
std::optional<PriceLevel> OrderBookReplica::bestBid() const {
    if (bids_.empty()) return std::nullopt;
    return bids_.begin()->second;
}

std::optional<PriceLevel> OrderBookReplica::bestAsk() const {
    if (asks_.empty()) return std::nullopt;
    return asks_.begin()->second;
}

double OrderBookReplica::midPrice() const {
    const bool hasBid = !bids_.empty();
    const bool hasAsk = !asks_.empty();
    if (hasBid && hasAsk) return (bids_.begin()->first + asks_.begin()->first) / 2.0;
    if (hasBid) return bids_.begin()->first;
    if (hasAsk) return asks_.begin()->first;
    return 0.0;
}

double OrderBookReplica::weightedMidPrice() const {
    if (bids_.empty() || asks_.empty()) return midPrice();
    const PriceLevel& b = bids_.begin()->second;
    const PriceLevel& a = asks_.begin()->second;
    const double total = b.size + a.size;
    if (total <= 0.0) return midPrice();
    return (b.price * a.size + a.price * b.size) / total;
}

double OrderBookReplica::spread() const {
    if (bids_.empty() || asks_.empty()) return 0.0;
    return asks_.begin()->first - bids_.begin()->first;
}

double OrderBookReplica::spreadBps() const {
    const double mid = midPrice();
    if (mid == 0.0) return 0.0;
    return spread() / mid * 10000.0;
}

bool OrderBookReplica::crossed() const {
    if (bids_.empty() || asks_.empty()) return false;
    return bids_.begin()->first >= asks_.begin()->first;
}

// --------- Depth ---------
std::vector<PriceLevel> OrderBookReplica::bids(size_t n) const { return topLevels(bids_, n); }
std::vector<PriceLevel> OrderBookReplica::asks(size_t n) const { return topLevels(asks_, n); }

double OrderBookReplica::depth(Side side, size_t n) const {
    return side == Side::Bid ? sumTop(bids_, n) : sumTop(asks_, n);
}

double OrderBookReplica::levelSize(Side side, double price) const {
    if (side == Side::Bid) {
        auto it = bids_.find(price);
        return it == bids_.end() ? 0.0 : it->second.size;
    }
    auto it = asks_.find(price);
    return it == asks_.end() ? 0.0 : it->second.size;
}

void OrderBookReplica::forEachLevel(Side side, size_t n,
                                    const std::function<void(const PriceLevel&)>& fn) const {
    size_t i = 0;
    if (side == Side::Bid) {
        for (const auto& kv : bids_) { if (i++ == n) break; fn(kv.second); }
    } else {
        for (const auto& kv : asks_) { if (i++ == n) break; fn(kv.second); }
    }
}

// --------- Integrity ---------
std::string OrderBookReplica::checksumPayload() const {
    return hunt::checksumPayload(topPairs(bids_, kChecksumDepth), topPairs(asks_, kChecksumDepth));
}

uint32_t OrderBookReplica::checksum() const {
    return checksumOf(checksumPayload());
}

// --------- Detection ---------
std::vector<PriceGap> OrderBookReplica::detectLiquidityVoid(VoidDirection direction,
                                                            double gapThreshold,
                                                            size_t scanLevels) const {
    std::vector<PriceGap> out;
    if (direction == VoidDirection::Above || direction == VoidDirection::Both) {
        scanGaps(asks_, scanLevels, gapThreshold,
                 [](double cur, double next) { return next - cur; }, out);
    }
    if (direction == VoidDirection::Below || direction == VoidDirection::Both) {
        scanGaps(bids_, scanLevels, gapThreshold,
                 [](double cur, double next) { return cur - next; }, out);
    }
    return out;
}

std::optional<WallHit> OrderBookReplica::detectWall(double minDepth, size_t scanLevels) const {
    size_t i = 0;
    for (const auto& kv : bids_) {
        if (i++ == scanLevels) break;
        if (kv.second.size >= minDepth) return WallHit{ Side::Bid, kv.first, kv.second.size };
    }
    i = 0;
    for (const auto& kv : asks_) {
        if (i++ == scanLevels) break;
        if (kv.second.size >= minDepth) return WallHit{ Side::Ask, kv.first, kv.second.size };
    }
    return std::nullopt;
}

std::string OrderBookReplica::summary() const {
    std::ostringstream oss;
    oss << instrument_;
    auto bb = bestBid();
    auto ba = bestAsk();
    oss << " bid=" << (bb ? util::fmt(bb->price) + "x" + util::fmt(bb->size) : std::string("-"))
        << " ask=" << (ba ? util::fmt(ba->price) + "x" + util::fmt(ba->size) : std::string("-"))
        << " spread_bps=" << util::fmt(spreadBps(), 4)
        << " levels=" << bids_.size() << "/" << asks_.size()
        << " updates=" << updateCount_
        << " errors=" << errorCount_
        << (consistent_ ? " ok" : " INCONSISTENT");
    return oss.str();
}

} // namespace hunt
