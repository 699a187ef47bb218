#include "hunt/book/BookRegistry.hpp"
#include "hunt/util/Logger.hpp"

#include <algorithm>
#include <mutex>
#include <sstream>

namespace hunt {

void InstrumentState::publish() {
    BookView v;
    v.summary    = book.summary();
    v.consistent = book.consistent();
    v.spread     = book.spread();
    v.bids       = book.bids(kBookViewDepth);
    v.asks       = book.asks(kBookViewDepth);

    std::lock_guard<std::mutex> lk(viewMx_);
    view_ = std::move(v);
}

BookView InstrumentState::view() const {
    std::lock_guard<std::mutex> lk(viewMx_);
    return view_;
}

BookRegistry::BookRegistry(size_t tapeCapacity, FeatureParams params)
    : tapeCapacity_(tapeCapacity), params_(params) {}

InstrumentState& BookRegistry::getOrCreate(const std::string& instrument) {
    {
        std::shared_lock rlk(mx_);
        auto it = states_.find(instrument);
        if (it != states_.end()) return *it->second;
    }
    std::unique_lock wlk(mx_);
    auto& slot = states_[instrument];
    if (!slot) {
        slot = std::make_unique<InstrumentState>(instrument, tapeCapacity_, params_);
        util::logger().log(util::LogLevel::Info, "registry.instrument_added",
                           { {"inst", instrument} });
    }
    return *slot;
}

InstrumentState* BookRegistry::find(const std::string& instrument) {
    std::shared_lock rlk(mx_);
    auto it = states_.find(instrument);
    return it == states_.end() ? nullptr : it->second.get();
}

const InstrumentState* BookRegistry::find(const std::string& instrument) const {
    std::shared_lock rlk(mx_);
    auto it = states_.find(instrument);
    return it == states_.end() ? nullptr : it->second.get();
}

bool BookRegistry::contains(const std::string& instrument) const {
    std::shared_lock rlk(mx_);
    return states_.count(instrument) != 0;
}

std::vector<std::string> BookRegistry::instruments() const {
    std::vector<std::string> out;
    {
        std::shared_lock rlk(mx_);
        out.reserve(states_.size());
        for (const auto& kv : states_) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t BookRegistry::size() const {
    std::shared_lock rlk(mx_);
    return states_.size();
}

BookMetricsSnapshot BookRegistry::stats() const {
    BookMetricsSnapshot total;
    std::shared_lock rlk(mx_);
    for (const auto& kv : states_) {
        const BookMetricsSnapshot s = kv.second->book.metrics();
        total.snapshots        += s.snapshots;
        total.deltas           += s.deltas;
        total.checksumFailures += s.checksumFailures;
        total.crossedBooks     += s.crossedBooks;
        total.seqGaps          += s.seqGaps;
        total.levelsTouched    += s.levelsTouched;
    }
    return total;
}

std::vector<std::string> BookRegistry::summaries() const {
    std::vector<std::string> out;
    for (const auto& inst : instruments()) {
        if (const InstrumentState* st = find(inst)) out.push_back(st->view().summary);
    }
    return out;
}

std::string BookRegistry::dumpLadder(const std::string& instrument, size_t maxLevelsPerSide) const {
    const InstrumentState* st = find(instrument);
    if (!st) return instrument + ": <none>";

    const BookView v = st->view();
    const size_t n = std::min(maxLevelsPerSide, kBookViewDepth);

    std::ostringstream oss;
    oss << instrument << (v.consistent ? "" : " (inconsistent)") << "\n";
    const size_t askCount = std::min(n, v.asks.size());
    for (size_t i = askCount; i-- > 0;) {
        const PriceLevel& lv = v.asks[i];
        oss << "  ask " << util::fmt(lv.price) << " x " << util::fmt(lv.size)
            << " (" << lv.orderCount << ")\n";
    }
    oss << "  ---- spread " << util::fmt(v.spread) << "\n";
    for (size_t i = 0; i < std::min(n, v.bids.size()); ++i) {
        const PriceLevel& lv = v.bids[i];
        oss << "  bid " << util::fmt(lv.price) << " x " << util::fmt(lv.size)
            << " (" << lv.orderCount << ")\n";
    }
    return oss.str();
}

} // namespace hunt
