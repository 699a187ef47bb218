#include "hunt/ws/StreamClient.hpp"
#include "hunt/Time.hpp"
#include "hunt/util/Config.hpp"
#include "hunt/util/Logger.hpp"
#include "hunt/util/Metrics.hpp"
#include "hunt/ws/Signer.hpp"

#include <algorithm>

namespace hunt::ws {

using util::LogLevel;
using util::logger;
using std::chrono::milliseconds;

// Receive slice; a quiet period only counts toward the keepalive once a
// whole receiveTimeout has passed without frames.
constexpr milliseconds kReceiveSlice{1000};

const char* stateName(StreamState s) {
  switch (s) {
    case StreamState::Disconnected:   return "disconnected";
    case StreamState::Connecting:     return "connecting";
    case StreamState::Authenticating: return "authenticating";
    case StreamState::Subscribed:     return "subscribed";
    case StreamState::Listening:      return "listening";
    case StreamState::Reconnecting:   return "reconnecting";
  }
  return "disconnected";
}

StreamSettings StreamSettings::fromConfig(const util::Config& cfg) {
  StreamSettings s;
  s.host           = cfg.wsHost;
  s.paperHost      = cfg.wsPaperHost;
  s.port           = cfg.wsPort;
  s.publicPath     = cfg.wsPublicPath;
  s.privatePath    = cfg.wsPrivatePath;
  s.paper          = cfg.paperTrading();
  s.apiKey         = cfg.apiKey;
  s.secretKey      = cfg.secretKey;
  s.passphrase     = cfg.passphrase;
  s.reconnectDelay = milliseconds(cfg.reconnectDelayMs);
  s.receiveTimeout = milliseconds(cfg.receiveTimeoutMs);
  s.loginTimeout   = milliseconds(cfg.loginTimeoutMs);
  return s;
}

StreamClient::StreamClient(std::unique_ptr<Transport> transport, StreamSettings settings)
  : transport_(std::move(transport)), settings_(std::move(settings)) {}

StreamClient::~StreamClient() {
  stop();
}

void StreamClient::setState(StreamState s) {
  const StreamState prev = state_.exchange(s, std::memory_order_acq_rel);
  if (prev != s) {
    logger().log(LogLevel::Debug, "stream.state",
                 { {"from", stateName(prev)}, {"to", stateName(s)} });
  }
}

StreamStats StreamClient::stats() const {
  std::lock_guard<std::mutex> lk(statsMx_);
  return stats_;
}

// --------- Session ---------
void StreamClient::connect(bool privateChannel) {
  private_ = privateChannel || settings_.paper;
  running_.store(true, std::memory_order_release);
  try {
    openSession();
  } catch (...) {
    setState(StreamState::Disconnected);
    running_.store(false, std::memory_order_release);
    throw;
  }
}

void StreamClient::openSession() {
  setState(StreamState::Connecting);
  Endpoint ep;
  ep.host      = settings_.paper ? settings_.paperHost : settings_.host;
  ep.port      = settings_.port;
  ep.path      = private_ ? settings_.privatePath : settings_.publicPath;
  ep.simulated = settings_.paper;
  transport_->open(ep);

  if (private_) login();

  replaySubscriptions();
  setState(StreamState::Subscribed);
}

void StreamClient::login() {
  setState(StreamState::Authenticating);
  if (settings_.apiKey.empty() || settings_.secretKey.empty()) {
    throw AuthError("private channel requires api key and secret");
  }

  const std::string ts = std::to_string(nowMs());
  transport_->send(buildLogin(settings_.apiKey, settings_.passphrase, ts,
                              loginSignature(settings_.secretKey, ts)));

  const auto deadline = Clock::now() + settings_.loginTimeout;
  while (true) {
    const auto left = std::chrono::duration_cast<milliseconds>(deadline - Clock::now());
    if (left.count() <= 0) throw AuthError("login not acknowledged within timeout");

    Received r = transport_->receive(left);
    if (r.status == RecvStatus::Timeout) continue;
    if (r.status == RecvStatus::Closed) throw AuthError("connection closed during login: " + r.text);

    auto m = decode(r.text);
    if (!m) {
      logger().log(LogLevel::Warn, "stream.login.bad_frame", { {"err", m.error().describe()} });
      continue;
    }
    if (isLoginAck(*m)) {
      logger().log(LogLevel::Info, "stream.login.ok", {});
      return;
    }
    if (m->kind == MessageKind::Event && (m->event == "login" || m->event == "error")) {
      throw AuthError("login rejected: code=" + m->code + " msg=" + m->msg);
    }
  }
}

void StreamClient::replaySubscriptions() {
  std::vector<ChannelArg> args = subscriptions();
  if (args.empty()) return;
  transport_->send(buildSubscribe(args));
  logger().log(LogLevel::Info, "stream.resubscribed", { {"count", std::to_string(args.size())} });
}

// --------- Subscriptions ---------
void StreamClient::subscribe(const std::vector<ChannelArg>& args) {
  if (args.empty()) return;
  {
    std::lock_guard<std::mutex> lk(subsMx_);
    subs_.insert(args.begin(), args.end());
  }
  if (transport_->isOpen()) {
    transport_->send(buildSubscribe(args));
    if (state() != StreamState::Listening) setState(StreamState::Subscribed);
  }
}

void StreamClient::unsubscribe(const std::vector<ChannelArg>& args) {
  if (args.empty()) return;
  {
    std::lock_guard<std::mutex> lk(subsMx_);
    for (const auto& a : args) subs_.erase(a);
  }
  if (transport_->isOpen()) transport_->send(buildUnsubscribe(args));
}

std::vector<ChannelArg> StreamClient::subscriptions() const {
  std::lock_guard<std::mutex> lk(subsMx_);
  return std::vector<ChannelArg>(subs_.begin(), subs_.end());
}

void StreamClient::addSubscriber(Route route, Subscriber fn) {
  subscribers_[route].push_back(std::move(fn));
}

// --------- Listening ---------
void StreamClient::listen() {
  if (!running()) return;
  setState(StreamState::Listening);

  const milliseconds slice = std::min(kReceiveSlice, settings_.receiveTimeout);
  milliseconds idle{0};

  while (running()) {
    Received r;
    try {
      r = transport_->receive(slice);
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, "stream.receive_failed", { {"err", ex.what()} });
      r = { RecvStatus::Closed, ex.what() };
    }

    switch (r.status) {
      case RecvStatus::Message:
        idle = milliseconds{0};
        handleFrame(r.text);
        break;

      case RecvStatus::Timeout:
        idle += slice;
        if (idle >= settings_.receiveTimeout) {
          idle = milliseconds{0};
          try {
            transport_->ping();
            std::lock_guard<std::mutex> lk(statsMx_);
            ++stats_.pings;
          } catch (const std::exception& ex) {
            logger().log(LogLevel::Warn, "stream.ping_failed", { {"err", ex.what()} });
            if (running()) reconnect();
          }
        }
        break;

      case RecvStatus::Closed:
        logger().log(LogLevel::Warn, "stream.closed", { {"why", r.text} });
        idle = milliseconds{0};
        if (running()) reconnect();
        break;
    }
  }

  transport_->close();
  setState(StreamState::Disconnected);
}

void StreamClient::reconnect() {
  setState(StreamState::Reconnecting);
  transport_->close();

  while (running()) {
    if (!sleepFor(settings_.reconnectDelay)) break;
    try {
      openSession();
      setState(StreamState::Listening);
      {
        std::lock_guard<std::mutex> lk(statsMx_);
        ++stats_.reconnects;
      }
      HUNT_METRIC_HIT("stream.reconnects");
      logger().log(LogLevel::Info, "stream.reconnected",
                   { {"private", private_ ? "1" : "0"} });
      return;
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, "stream.reconnect_failed", { {"err", ex.what()} });
      setState(StreamState::Reconnecting);
      transport_->close();
    }
  }
}

void StreamClient::stop() {
  {
    std::lock_guard<std::mutex> lk(sleepMx_);
    running_.store(false, std::memory_order_release);
  }
  sleepCv_.notify_all();
}

bool StreamClient::sleepFor(milliseconds d) {
  std::unique_lock<std::mutex> lk(sleepMx_);
  return !sleepCv_.wait_for(lk, d, [this] { return !running(); });
}

// --------- Dispatch ---------
void StreamClient::handleFrame(const std::string& text) {
  {
    std::lock_guard<std::mutex> lk(statsMx_);
    ++stats_.messages;
  }

  auto decoded = decode(text);
  if (!decoded) {
    std::lock_guard<std::mutex> lk(statsMx_);
    ++stats_.dropped;
    logger().log(LogLevel::Warn, "stream.bad_frame",
                 { {"err", decoded.error().describe()}, {"frame", text.substr(0, 256)} });
    return;
  }
  const Message& m = *decoded;

  if (m.kind == MessageKind::Pong) {
    logger().log(LogLevel::Trace, "stream.pong", {});
    return;
  }
  if (m.kind == MessageKind::Event) {
    handleEvent(m);
    return;
  }

  auto it = subscribers_.find(m.route);
  if (m.route == Route::Unknown || it == subscribers_.end()) {
    std::lock_guard<std::mutex> lk(statsMx_);
    ++stats_.dropped;
    logger().log(LogLevel::Debug, "stream.unrouted", { {"channel", m.channel} });
    return;
  }

  for (const auto& fn : it->second) {
    try {
      fn(m);
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, "stream.subscriber_failed",
                   { {"route", routeName(m.route)}, {"err", ex.what()} });
    }
  }
  std::lock_guard<std::mutex> lk(statsMx_);
  ++stats_.dispatched;
}

void StreamClient::handleEvent(const Message& m) {
  if (m.event == "error") {
    logger().log(LogLevel::Error, "stream.event.error",
                 { {"code", m.code}, {"msg", m.msg} });
    return;
  }
  logger().log(LogLevel::Info, "stream.event",
               { {"event", m.event}, {"channel", m.channel},
                 {"inst", m.instId}, {"code", m.code} });
}

} // namespace hunt::ws
