#pragma once

#include "hunt/book/OrderBookReplica.hpp"
#include "hunt/book/TradeTape.hpp"
#include "hunt/features/FeatureExtractor.hpp"
#include "hunt/util/Metrics.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hunt {

// Levels kept per side in a published view.
constexpr size_t kBookViewDepth = 10;

// Copy of a replica taken by its writer. Threads other than the stream
// listener read books only through this.
struct BookView {
    std::string summary;
    bool        consistent = false;
    double      spread = 0.0;
    std::vector<PriceLevel> bids;   // best first
    std::vector<PriceLevel> asks;   // best first
};

// Everything kept for one instrument. Addresses are stable for the
// registry's lifetime (the extractor references the book and tape).
struct InstrumentState {
    InstrumentState(const std::string& instrument, size_t tapeCapacity, FeatureParams params)
        : book(instrument), tape(tapeCapacity), features(instrument, book, tape, params) {
        publish();
    }

    // Writer thread only, after every apply.
    void publish();
    BookView view() const;

    OrderBookReplica book;
    TradeTape        tape;
    FeatureExtractor features;

    // Set once a fresh snapshot has been requested; cleared by a consistent one.
    bool resyncPending = false;

private:
    mutable std::mutex viewMx_;
    BookView view_;
};

// Per-instrument lookup owned by the orchestrator and passed by reference.
// The map itself is guarded; the per-instrument state has a single writer.
// summaries() and dumpLadder() read the published views and are safe from
// any thread.
class BookRegistry {
public:
    explicit BookRegistry(size_t tapeCapacity = 1000, FeatureParams params = {});

    InstrumentState& getOrCreate(const std::string& instrument);
    InstrumentState* find(const std::string& instrument);
    const InstrumentState* find(const std::string& instrument) const;

    bool contains(const std::string& instrument) const;
    std::vector<std::string> instruments() const;
    size_t size() const;

    // Sum of every replica's counters.
    BookMetricsSnapshot stats() const;
    std::vector<std::string> summaries() const;

    // Human readable ladder, asks above bids, best levels adjacent.
    std::string dumpLadder(const std::string& instrument, size_t maxLevelsPerSide = 10) const;

private:
    size_t tapeCapacity_;
    FeatureParams params_;

    std::unordered_map<std::string, std::unique_ptr<InstrumentState>> states_;
    mutable std::shared_mutex mx_;
};

} // namespace hunt
