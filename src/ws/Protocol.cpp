#include "hunt/ws/Protocol.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <unordered_map>

namespace hunt::ws {

// ----------------- Tiny helpers -----------------
namespace {

inline std::string strOr(const rapidjson::Value& v, const char* k, const std::string& def = "") {
  return (v.HasMember(k) && v[k].IsString()) ? std::string(v[k].GetString()) : def;
}

// Exchange numbers arrive as strings ("41006.8") or, occasionally, raw numbers.
// Non-finite values are rejected; a NaN price would break the ladder ordering.
inline bool numberOf(const rapidjson::Value& v, double& out) {
  double x = 0.0;
  if (v.IsNumber()) {
    x = v.GetDouble();
  } else if (v.IsString()) {
    const char* s = v.GetString();
    char* end = nullptr;
    x = std::strtod(s, &end);
    if (end == s) return false;
  } else {
    return false;
  }
  if (!std::isfinite(x)) return false;
  out = x;
  return true;
}

inline double numOr(const rapidjson::Value& v, const char* k, double def) {
  double out = def;
  if (v.HasMember(k) && numberOf(v[k], out)) return out;
  return def;
}

inline int64_t intOr(const rapidjson::Value& v, const char* k, int64_t def) {
  if (!v.HasMember(k)) return def;
  const auto& x = v[k];
  if (x.IsInt64()) return x.GetInt64();
  if (x.IsString()) {
    const char* s = x.GetString();
    char* end = nullptr;
    const long long r = std::strtoll(s, &end, 10);
    return end != s ? static_cast<int64_t>(r) : def;
  }
  return def;
}

// [price, size, liquidatedOrders, orderCount] or [price, size, orderCount]
Result<LevelUpdates> levelsOf(const rapidjson::Value& obj, const char* key) {
  LevelUpdates out;
  if (!obj.HasMember(key)) return out;
  const auto& arr = obj[key];
  if (!arr.IsArray()) return Error{ std::string("'") + key + "' is not an array", "protocol" };
  out.reserve(arr.Size());
  for (const auto& lv : arr.GetArray()) {
    if (!lv.IsArray() || lv.Size() < 2) {
      return Error{ std::string("malformed level in '") + key + "'", "protocol" };
    }
    LevelUpdate u;
    if (!numberOf(lv[0], u.price) || !numberOf(lv[1], u.size)) {
      return Error{ std::string("non-numeric level in '") + key + "'", "protocol" };
    }
    const rapidjson::SizeType countIdx = lv.Size() >= 4 ? 3 : 2;
    double count = 0.0;
    if (lv.Size() > countIdx && numberOf(lv[countIdx], count) && count > 0.0) {
      constexpr double kMaxCount = static_cast<double>(std::numeric_limits<uint32_t>::max());
      u.orderCount = static_cast<uint32_t>(std::min(count, kMaxCount));
    }
    out.push_back(u);
  }
  return out;
}

const rapidjson::Value* dataArray(const Message& m) {
  if (!m.doc || !m.doc->IsObject() || !m.doc->HasMember("data")) return nullptr;
  const auto& d = (*m.doc)["data"];
  return d.IsArray() ? &d : nullptr;
}

std::string buildOp(const char* op, const std::vector<ChannelArg>& args) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("op"); w.String(op);
  w.Key("args");
  w.StartArray();
  for (const auto& a : args) {
    w.StartObject();
    w.Key("channel"); w.String(a.channel.c_str());
    if (!a.instId.empty()) { w.Key("instId"); w.String(a.instId.c_str()); }
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();
  return sb.GetString();
}

} // namespace

// ----------------- Routing -----------------
Route routeForChannel(const std::string& channel) {
  static const std::unordered_map<std::string, Route> kRoutes = {
    {"tickers",            Route::Ticker},
    {"books",              Route::OrderBook},
    {"books5",             Route::OrderBook},
    {"books-l2-tbt",       Route::OrderBook},
    {"books50-l2-tbt",     Route::OrderBook},
    {"trades",             Route::Trades},
    {"liquidation-orders", Route::Liquidation},
    {"account",            Route::Account},
    {"orders",             Route::Orders},
  };
  auto it = kRoutes.find(channel);
  return it == kRoutes.end() ? Route::Unknown : it->second;
}

const char* routeName(Route r) {
  switch (r) {
    case Route::Ticker:      return "ticker";
    case Route::OrderBook:   return "orderbook";
    case Route::Trades:      return "trades";
    case Route::Liquidation: return "liquidation";
    case Route::Account:     return "account";
    case Route::Orders:      return "orders";
    case Route::Unknown:     return "unknown";
  }
  return "unknown";
}

// ----------------- Outbound -----------------
std::string buildSubscribe(const std::vector<ChannelArg>& args)   { return buildOp("subscribe", args); }
std::string buildUnsubscribe(const std::vector<ChannelArg>& args) { return buildOp("unsubscribe", args); }

std::string buildLogin(const std::string& apiKey, const std::string& passphrase,
                       const std::string& timestamp, const std::string& sign) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("op"); w.String("login");
  w.Key("args");
  w.StartArray();
  w.StartObject();
  w.Key("apiKey");     w.String(apiKey.c_str());
  w.Key("passphrase"); w.String(passphrase.c_str());
  w.Key("timestamp");  w.String(timestamp.c_str());
  w.Key("sign");       w.String(sign.c_str());
  w.EndObject();
  w.EndArray();
  w.EndObject();
  return sb.GetString();
}

// ----------------- Inbound -----------------
Result<Message> decode(const std::string& text) {
  Message m;
  if (text == "pong") {
    m.kind = MessageKind::Pong;
    return m;
  }

  auto doc = std::make_shared<rapidjson::Document>();
  doc->Parse(text.c_str(), text.size());
  if (doc->HasParseError()) {
    return Error{ std::string("bad json: ") + rapidjson::GetParseError_En(doc->GetParseError()), "protocol" };
  }
  if (!doc->IsObject()) return Error{ "frame is not an object", "protocol" };

  if (doc->HasMember("event")) {
    m.kind  = MessageKind::Event;
    m.event = strOr(*doc, "event");
    m.code  = strOr(*doc, "code");
    m.msg   = strOr(*doc, "msg");
    if (doc->HasMember("arg") && (*doc)["arg"].IsObject()) {
      m.channel = strOr((*doc)["arg"], "channel");
      m.instId  = strOr((*doc)["arg"], "instId");
    }
    m.doc = std::move(doc);
    return m;
  }

  if (!doc->HasMember("arg") || !(*doc)["arg"].IsObject()) {
    return Error{ "frame has neither 'event' nor 'arg'", "protocol" };
  }
  m.kind    = MessageKind::Data;
  m.channel = strOr((*doc)["arg"], "channel");
  m.instId  = strOr((*doc)["arg"], "instId");
  m.action  = strOr(*doc, "action");
  m.route   = routeForChannel(m.channel);
  m.doc     = std::move(doc);
  return m;
}

bool isLoginAck(const Message& m) {
  return m.kind == MessageKind::Event && m.event == "login" && m.code == "0";
}

// ----------------- Payloads -----------------
Result<std::vector<BookUpdate>> decodeBooks(const Message& m) {
  const rapidjson::Value* data = dataArray(m);
  if (!data) return Error{ "book frame without data array", m.channel };

  std::vector<BookUpdate> out;
  out.reserve(data->Size());
  for (const auto& d : data->GetArray()) {
    if (!d.IsObject()) return Error{ "book entry is not an object", m.channel };

    BookUpdate u;
    u.instrument = strOr(d, "instId", m.instId);
    // Channels without an action (books5) always carry full snapshots.
    u.snapshot = m.action.empty() || m.action == "snapshot";

    auto bids = levelsOf(d, "bids");
    if (!bids) return bids.error();
    auto asks = levelsOf(d, "asks");
    if (!asks) return asks.error();
    u.bids = std::move(bids.value());
    u.asks = std::move(asks.value());

    u.checksum      = intOr(d, "checksum", 0);
    u.seq.seqId     = intOr(d, "seqId", -1);
    u.seq.prevSeqId = intOr(d, "prevSeqId", -1);
    u.timestampMs   = intOr(d, "ts", 0);
    out.push_back(std::move(u));
  }
  return out;
}

Result<std::vector<TradeEvent>> decodeTrades(const Message& m) {
  const rapidjson::Value* data = dataArray(m);
  if (!data) return Error{ "trade frame without data array", m.channel };

  std::vector<TradeEvent> out;
  out.reserve(data->Size());
  for (const auto& d : data->GetArray()) {
    if (!d.IsObject()) return Error{ "trade entry is not an object", m.channel };

    TradeEvent t;
    t.instrument  = strOr(d, "instId", m.instId);
    t.price       = numOr(d, "px", 0.0);
    t.size        = numOr(d, "sz", 0.0);
    t.side        = strOr(d, "side") == "sell" ? TradeSide::Sell : TradeSide::Buy;
    t.timestampMs = intOr(d, "ts", 0);
    t.tradeId     = strOr(d, "tradeId");
    if (t.price <= 0.0 || t.size <= 0.0) {
      return Error{ "trade without price or size", m.channel };
    }
    out.push_back(std::move(t));
  }
  return out;
}

} // namespace hunt::ws
