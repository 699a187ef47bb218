#pragma once

#include "hunt/ws/Transport.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace hunt::test {

// Scripted transport. Frames are served from `inbox` in order; once it is
// empty, `idleTimeouts` timeouts are returned and then `onDrained` runs.
class FakeTransport final : public ws::Transport {
public:
  struct State {
    std::deque<ws::Received> inbox;
    std::vector<std::string> sent;
    std::vector<ws::Endpoint> opens;
    int  closes = 0;
    int  pings  = 0;
    int  failOpens = 0;
    int  idleTimeouts = 0;
    bool open = false;
    bool autoLoginAck = true;
    std::function<void()> onDrained;

    void push(const std::string& frame) { inbox.push_back({ws::RecvStatus::Message, frame}); }
    void pushClosed(const std::string& why = "eof") { inbox.push_back({ws::RecvStatus::Closed, why}); }

    size_t countSent(const std::string& needle) const {
      size_t n = 0;
      for (const auto& s : sent) if (s.find(needle) != std::string::npos) ++n;
      return n;
    }
  };

  explicit FakeTransport(std::shared_ptr<State> st) : st_(std::move(st)) {}

  void open(const ws::Endpoint& ep) override {
    st_->opens.push_back(ep);
    if (st_->failOpens > 0) {
      --st_->failOpens;
      throw ws::TransportError("connect refused");
    }
    st_->open = true;
  }

  void send(const std::string& text) override {
    if (!st_->open) throw ws::TransportError("not open");
    st_->sent.push_back(text);
    if (st_->autoLoginAck && text.find("\"op\":\"login\"") != std::string::npos) {
      st_->inbox.push_front({ws::RecvStatus::Message, R"({"event":"login","code":"0","msg":""})"});
    }
  }

  ws::Received receive(std::chrono::milliseconds) override {
    if (!st_->inbox.empty()) {
      ws::Received r = st_->inbox.front();
      st_->inbox.pop_front();
      if (r.status == ws::RecvStatus::Closed) st_->open = false;
      return r;
    }
    if (st_->idleTimeouts > 0) {
      --st_->idleTimeouts;
    } else if (st_->onDrained) {
      st_->onDrained();
    }
    return {ws::RecvStatus::Timeout, ""};
  }

  void ping() override {
    if (!st_->open) throw ws::TransportError("not open");
    ++st_->pings;
  }

  void close() override {
    ++st_->closes;
    st_->open = false;
  }

  bool isOpen() const override { return st_->open; }

private:
  std::shared_ptr<State> st_;
};

} // namespace hunt::test
