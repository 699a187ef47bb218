#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace hunt {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
// Optional: can run a background reporter thread that logs a snapshot.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;

  void startReporter(unsigned int intervalSeconds = 10);
  void stopReporter();

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  double counter(const std::string& name) const;
  double gauge(const std::string& name) const;

  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void clear();

private:
  void reporterLoop(unsigned int intervalSeconds);

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;

  std::atomic<bool> running_{false};
  std::thread thr_;
};

} // namespace util

// -----------------------------------------------------------------------------
// Per-replica book counters
// -----------------------------------------------------------------------------

struct BookMetricsSnapshot {
  uint64_t snapshots         = 0;
  uint64_t deltas            = 0;
  uint64_t checksumFailures  = 0;
  uint64_t crossedBooks      = 0;
  uint64_t seqGaps           = 0;
  uint64_t levelsTouched     = 0;
};

class BookMetrics {
public:
  void incSnapshots()        { snapshots_.fetch_add(1, std::memory_order_relaxed); }
  void incDeltas()           { deltas_.fetch_add(1, std::memory_order_relaxed); }
  void incChecksumFailures() { checksumFailures_.fetch_add(1, std::memory_order_relaxed); }
  void incCrossedBooks()     { crossedBooks_.fetch_add(1, std::memory_order_relaxed); }
  void incSeqGap()           { seqGaps_.fetch_add(1, std::memory_order_relaxed); }
  void addLevelsTouched(uint64_t n) { levelsTouched_.fetch_add(n, std::memory_order_relaxed); }

  BookMetricsSnapshot snapshot() const {
    BookMetricsSnapshot s;
    s.snapshots        = snapshots_.load(std::memory_order_relaxed);
    s.deltas           = deltas_.load(std::memory_order_relaxed);
    s.checksumFailures = checksumFailures_.load(std::memory_order_relaxed);
    s.crossedBooks     = crossedBooks_.load(std::memory_order_relaxed);
    s.seqGaps          = seqGaps_.load(std::memory_order_relaxed);
    s.levelsTouched    = levelsTouched_.load(std::memory_order_relaxed);
    return s;
  }

private:
  std::atomic<uint64_t> snapshots_{0};
  std::atomic<uint64_t> deltas_{0};
  std::atomic<uint64_t> checksumFailures_{0};
  std::atomic<uint64_t> crossedBooks_{0};
  std::atomic<uint64_t> seqGaps_{0};
  std::atomic<uint64_t> levelsTouched_{0};
};

// -----------------------------------------------------------------------------
// Convenience macros
// -----------------------------------------------------------------------------
#define HUNT_METRIC_INC(name, d) ::hunt::util::MetricRegistry::instance().increment((name), (d))
#define HUNT_METRIC_HIT(name)    ::hunt::util::MetricRegistry::instance().increment((name), 1.0)
#define HUNT_METRIC_SET(name, v) ::hunt::util::MetricRegistry::instance().setGauge((name), (v))

} // namespace hunt
