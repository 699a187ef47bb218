#pragma once

#include "hunt/Result.hpp"
#include "hunt/book/Types.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hunt::ws {

// Internal subscriber lists a channel is routed to.
enum class Route : uint8_t { Ticker, OrderBook, Trades, Liquidation, Account, Orders, Unknown };

Route routeForChannel(const std::string& channel);
const char* routeName(Route r);

struct ChannelArg {
  std::string channel;
  std::string instId;

  bool operator==(const ChannelArg& o) const { return channel == o.channel && instId == o.instId; }
  bool operator<(const ChannelArg& o) const {
    return channel != o.channel ? channel < o.channel : instId < o.instId;
  }
};

// ---- Outbound frames ----
std::string buildSubscribe(const std::vector<ChannelArg>& args);
std::string buildUnsubscribe(const std::vector<ChannelArg>& args);
std::string buildLogin(const std::string& apiKey, const std::string& passphrase,
                       const std::string& timestamp, const std::string& sign);
inline const char* pingFrame() { return "ping"; }

// ---- Inbound frames ----
enum class MessageKind : uint8_t { Data, Event, Pong };

struct Message {
  MessageKind kind = MessageKind::Data;

  // Event frames
  std::string event;
  std::string code;
  std::string msg;

  // Data frames
  std::string channel;
  std::string instId;
  std::string action;   // "snapshot" | "update" | empty
  Route route = Route::Unknown;

  // Whole frame; "data" is read through the decoders below.
  std::shared_ptr<const rapidjson::Document> doc;
};

// Malformed JSON or a frame that is neither data nor event is an Error.
Result<Message> decode(const std::string& text);

// "event":"login" with "code":"0"
bool isLoginAck(const Message& m);

// ---- Payload decoders ----
struct BookUpdate {
  std::string  instrument;
  bool         snapshot = false;
  LevelUpdates bids;
  LevelUpdates asks;
  int64_t      checksum = 0;
  BookSeq      seq;
  int64_t      timestampMs = 0;
};

Result<std::vector<BookUpdate>> decodeBooks(const Message& m);
Result<std::vector<TradeEvent>> decodeTrades(const Message& m);

} // namespace hunt::ws
