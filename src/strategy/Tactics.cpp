#include "hunt/strategy/Tactics.hpp"
#include "hunt/util/Config.hpp"
#include "hunt/util/Logger.hpp"

#include <algorithm>
#include <sstream>

namespace hunt {

using util::LogLevel;
using util::logger;

// --------- Params ---------
FrontRunning::Params FrontRunning::Params::fromConfig(const util::Config& cfg) {
  Params p;
  p.largeTradeThreshold = cfg.largeTradeThreshold;
  p.depthDropThreshold  = cfg.depthDropThreshold;
  p.historyLength       = cfg.depthHistoryLength;
  p.size                = cfg.frontRunSize;
  return p;
}

WallRiding::Params WallRiding::Params::fromConfig(const util::Config& cfg) {
  Params p;
  p.depthThreshold = cfg.wallDepthThreshold;
  p.persistenceSec = cfg.wallPersistenceSec;
  p.absenceSec     = cfg.wallAbsenceSec;
  p.scanLevels     = cfg.wallScanLevels;
  p.tickSize       = cfg.tickSize;
  p.size           = cfg.wallRideSize;
  p.confidence     = cfg.wallRideConfidence;
  return p;
}

SpreadCapturing::Params SpreadCapturing::Params::fromConfig(const util::Config& cfg) {
  Params p;
  p.minSpreadBps = cfg.minSpreadBps;
  p.maxSpreadBps = cfg.maxSpreadBps;
  p.size         = cfg.spreadSize;
  p.confidence   = cfg.spreadConfidence;
  return p;
}

// --------- Front-running ---------
bool FrontRunning::checkDepthDrop(double current, double prev) const {
  if (prev <= 0.0) return false;
  return (prev - current) / prev >= p_.depthDropThreshold;
}

std::optional<Signal> FrontRunning::onTrade(const TacticContext& ctx, const TradeEvent& trade) {
  if (trade.size < p_.largeTradeThreshold) return std::nullopt;

  // A sell aggressor eats bids, a buy aggressor eats asks.
  const Side passive = trade.side == TradeSide::Sell ? Side::Bid : Side::Ask;

  const auto& hist = ctx.features.depthHistory();
  const size_t n = std::min(p_.historyLength, hist.size());
  double peak = 0.0;
  for (size_t i = hist.size() - n; i < hist.size(); ++i) {
    peak = std::max(peak, passive == Side::Bid ? hist[i].bidDepth5 : hist[i].askDepth5);
  }
  const double current = ctx.book.depth(passive, 5);

  logger().log(LogLevel::Debug, "front_running.large_trade",
               { {"inst", ctx.instrument}, {"side", tradeSideName(trade.side)},
                 {"size", util::fmt(trade.size)}, {"peak", util::fmt(peak)},
                 {"now", util::fmt(current)} });

  if (!checkDepthDrop(current, peak)) return std::nullopt;

  auto touch = passive == Side::Bid ? ctx.book.bestBid() : ctx.book.bestAsk();
  Signal s;
  s.strategy   = kName;
  s.instrument = ctx.instrument;
  s.action     = passive == Side::Bid ? SignalAction::Sell : SignalAction::Buy;
  s.type       = OrderType::Market;
  s.price      = touch ? touch->price : (trade.price > 0.0 ? trade.price : ctx.book.midPrice());
  s.size       = p_.size;
  s.confidence = std::clamp((peak - current) / peak, 0.0, 1.0);
  s.created    = ctx.now;

  std::ostringstream why;
  why << tradeSideName(trade.side) << " " << util::fmt(trade.size)
      << " while " << sideName(passive) << " depth fell "
      << util::fmt(peak) << " -> " << util::fmt(current);
  s.reason = why.str();
  return s;
}

// --------- Wall-riding ---------
void WallRiding::observe(const TacticContext& ctx) {
  WallMap& walls = walls_[ctx.instrument];

  ctx.book.forEachLevel(Side::Bid, p_.scanLevels, [&](const PriceLevel& lv) {
    if (lv.size < p_.depthThreshold) return;
    auto it = walls.find(lv.price);
    if (it == walls.end()) {
      walls.emplace(lv.price, WallObservation{ lv.price, lv.size, ctx.now, ctx.now });
      logger().log(LogLevel::Info, "wall_riding.wall_seen",
                   { {"inst", ctx.instrument}, {"price", util::fmt(lv.price)},
                     {"depth", util::fmt(lv.size)} });
    } else {
      it->second.lastSeen = ctx.now;
      it->second.depth    = lv.size;
    }
  });

  for (auto it = walls.begin(); it != walls.end();) {
    if (secondsBetween(it->second.lastSeen, ctx.now) > p_.absenceSec) {
      logger().log(LogLevel::Info, "wall_riding.wall_gone",
                   { {"inst", ctx.instrument}, {"price", util::fmt(it->first)} });
      it = walls.erase(it);
    } else {
      ++it;
    }
  }
}

std::optional<WallObservation> WallRiding::canRideWall(const std::string& instrument, TimePoint now) const {
  auto it = walls_.find(instrument);
  if (it == walls_.end()) return std::nullopt;
  for (const auto& kv : it->second) {
    if (secondsBetween(kv.second.firstSeen, now) >= p_.persistenceSec) return kv.second;
  }
  return std::nullopt;
}

std::vector<WallObservation> WallRiding::walls(const std::string& instrument) const {
  std::vector<WallObservation> out;
  auto it = walls_.find(instrument);
  if (it == walls_.end()) return out;
  for (const auto& kv : it->second) out.push_back(kv.second);
  return out;
}

std::optional<Signal> WallRiding::onOrderBook(const TacticContext& ctx) {
  observe(ctx);
  auto wall = canRideWall(ctx.instrument, ctx.now);
  if (!wall) return std::nullopt;

  Signal s;
  s.strategy   = kName;
  s.instrument = ctx.instrument;
  s.action     = SignalAction::Buy;
  s.type       = OrderType::Limit;
  s.price      = wall->price + p_.tickSize;
  s.size       = p_.size;
  s.confidence = p_.confidence;
  s.created    = ctx.now;

  std::ostringstream why;
  why << "wall " << util::fmt(wall->depth) << " @ " << util::fmt(wall->price)
      << " held " << util::fmt(secondsBetween(wall->firstSeen, ctx.now), 3) << "s";
  s.reason = why.str();
  return s;
}

// --------- Spread-capturing ---------
std::optional<Signal> SpreadCapturing::onOrderBook(const TacticContext& ctx) {
  auto bid = ctx.book.bestBid();
  auto ask = ctx.book.bestAsk();
  if (!bid || !ask) return std::nullopt;

  const double bps = ctx.book.spreadBps();
  if (bps < p_.minSpreadBps || bps > p_.maxSpreadBps) return std::nullopt;

  Signal s;
  s.strategy     = kName;
  s.instrument   = ctx.instrument;
  s.action       = SignalAction::MarketMake;
  s.type         = OrderType::Limit;
  s.price        = bid->price;
  s.counterPrice = ask->price;
  s.size         = p_.size;
  s.confidence   = p_.confidence;
  s.created      = ctx.now;
  s.reason       = "spread " + util::fmt(bps, 4) + " bps, quoting both sides";
  return s;
}

} // namespace hunt
