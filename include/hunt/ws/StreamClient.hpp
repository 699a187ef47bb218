#pragma once

#include "hunt/ws/Protocol.hpp"
#include "hunt/ws/Transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace hunt {
namespace util { class Config; }

namespace ws {

enum class StreamState : uint8_t {
  Disconnected,
  Connecting,
  Authenticating,
  Subscribed,
  Listening,
  Reconnecting
};

const char* stateName(StreamState s);

// Login rejected or not acknowledged in time. Fatal for the attempt.
class AuthError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct StreamSettings {
  std::string host        = "ws.okx.com";
  std::string paperHost   = "wspap.okx.com";
  std::string port        = "8443";
  std::string publicPath  = "/ws/v5/public";
  std::string privatePath = "/ws/v5/private";
  bool paper = true;

  std::string apiKey;
  std::string secretKey;
  std::string passphrase;

  std::chrono::milliseconds reconnectDelay{5000};
  std::chrono::milliseconds receiveTimeout{30000};
  std::chrono::milliseconds loginTimeout{10000};

  static StreamSettings fromConfig(const util::Config& cfg);
};

struct StreamStats {
  uint64_t messages   = 0;
  uint64_t dispatched = 0;
  uint64_t dropped    = 0;   // malformed or unrouted
  uint64_t pings      = 0;
  uint64_t reconnects = 0;
};

// Streaming session: connect / login / subscribe, then a listening loop that
// routes every frame to the subscribers of its channel and reconnects with
// the same privacy mode and subscription set when the transport drops.
class StreamClient {
public:
  using Subscriber = std::function<void(const Message&)>;

  StreamClient(std::unique_ptr<Transport> transport, StreamSettings settings);
  ~StreamClient();

  StreamClient(const StreamClient&)            = delete;
  StreamClient& operator=(const StreamClient&) = delete;

  // Paper mode always uses the private channel. Throws AuthError when the
  // login is rejected or times out, TransportError when the open fails.
  void connect(bool privateChannel = false);

  void subscribe(const std::vector<ChannelArg>& args);
  void unsubscribe(const std::vector<ChannelArg>& args);
  std::vector<ChannelArg> subscriptions() const;

  // Subscribers of one route run in registration order on the listener thread.
  void addSubscriber(Route route, Subscriber fn);

  // Blocks until stop().
  void listen();
  void stop();

  // Route one raw frame to its subscribers.
  void handleFrame(const std::string& text);

  StreamState state() const { return state_.load(std::memory_order_acquire); }
  bool running() const { return running_.load(std::memory_order_acquire); }
  bool privateMode() const { return private_; }
  StreamStats stats() const;

private:
  void openSession();
  void login();
  void replaySubscriptions();
  void reconnect();
  void setState(StreamState s);
  void handleEvent(const Message& m);
  // Sleeps up to d; returns false when stop() interrupted the wait.
  bool sleepFor(std::chrono::milliseconds d);

  std::unique_ptr<Transport> transport_;
  StreamSettings settings_;
  bool private_ = false;

  std::atomic<StreamState> state_{StreamState::Disconnected};
  std::atomic<bool> running_{false};

  mutable std::mutex subsMx_;
  std::set<ChannelArg> subs_;

  std::map<Route, std::vector<Subscriber>> subscribers_;

  mutable std::mutex statsMx_;
  StreamStats stats_;

  std::mutex sleepMx_;
  std::condition_variable sleepCv_;
};

} // namespace ws
} // namespace hunt
