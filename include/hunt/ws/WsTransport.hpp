#pragma once

#include "hunt/ws/Transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace hunt::ws {

// Completion state of one async write or close. The handler holds a
// reference, so an operation abandoned on timeout still has somewhere to
// land. The payload is owned here for the same reason.
struct PendingOp {
  bool done = false;
  boost::beast::error_code ec;
  std::string payload;
};

// Run handlers on `ioc` until `done` flips or the timeout passes.
bool pumpUntil(boost::asio::io_context& ioc, const bool& done, std::chrono::milliseconds timeout);

// wss:// client: Beast websocket over an Asio TLS stream with SNI.
// Not thread-safe; owned and driven by the listener thread.
class WsTransport final : public Transport {
public:
  using Tcp       = boost::asio::ip::tcp;
  using WsStream  = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;
  using ErrorCode = boost::beast::error_code;

  explicit WsTransport(bool verifyPeer = true);
  ~WsTransport() override;

  void open(const Endpoint& ep) override;
  void send(const std::string& text) override;
  Received receive(std::chrono::milliseconds timeout) override;
  void ping() override;
  void close() override;
  bool isOpen() const override;

private:
  void startRead();
  // Close the socket so stalled operations complete, then drain them.
  void abort();
  void reset();

  boost::asio::io_context ioc_;
  boost::asio::ssl::context ssl_;
  std::unique_ptr<WsStream> ws_;
  boost::beast::flat_buffer buffer_;
  std::string host_;

  std::shared_ptr<PendingOp> write_;   // last write, kept until it completes
  std::shared_ptr<PendingOp> close_;

  bool readPending_ = false;
  bool readDone_    = false;
  ErrorCode readEc_;
};

} // namespace hunt::ws
