#include "hunt/ws/WsTransport.hpp"
#include "hunt/util/Logger.hpp"

#include <boost/beast/version.hpp>
#include <openssl/ssl.h>

#include <chrono>
#include <iterator>

namespace hunt::ws {

namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;
namespace ssl       = boost::asio::ssl;

using namespace std::chrono_literals;
using util::LogLevel;
using util::logger;

WsTransport::WsTransport(bool verifyPeer)
  : ssl_(ssl::context::tls_client)
{
  ssl_.set_default_verify_paths();
  ssl_.set_verify_mode(verifyPeer ? ssl::verify_peer : ssl::verify_none);
}

WsTransport::~WsTransport() {
  close();
}

bool WsTransport::isOpen() const {
  return ws_ && ws_->is_open();
}

void WsTransport::reset() {
  ws_.reset();
  write_.reset();
  close_.reset();
  buffer_.consume(buffer_.size());
  readPending_ = false;
  readDone_    = false;
  readEc_      = {};
  ioc_.restart();
}

void WsTransport::open(const Endpoint& ep) {
  close();
  reset();
  host_ = ep.host;

  ws_ = std::make_unique<WsStream>(ioc_, ssl_);

  ErrorCode ec;
  Tcp::resolver resolver(ioc_);
  auto results = resolver.resolve(ep.host, ep.port, ec);
  if (ec) throw TransportError("resolve " + ep.host + ": " + ec.message());
  if (results.empty()) throw TransportError("resolve " + ep.host + ": no endpoints");

  beast::get_lowest_layer(*ws_).socket().connect(*results.begin(), ec);
  for (auto it = std::next(results.begin()); ec && it != results.end(); ++it) {
    beast::get_lowest_layer(*ws_).socket().close(ec);
    beast::get_lowest_layer(*ws_).socket().connect(*it, ec);
  }
  if (ec) throw TransportError("connect " + ep.host + ":" + ep.port + ": " + ec.message());

  // SNI: the exchange fronts several hosts behind one address.
  if (!SSL_set_tlsext_host_name(ws_->next_layer().native_handle(), ep.host.c_str())) {
    throw TransportError("SNI setup failed for " + ep.host);
  }
  ws_->next_layer().handshake(ssl::stream_base::client, ec);
  if (ec) throw TransportError("tls handshake: " + ec.message());

  const bool simulated = ep.simulated;
  ws_->set_option(websocket::stream_base::decorator(
    [simulated](websocket::request_type& req) {
      req.set(beast::http::field::user_agent,
              std::string(BOOST_BEAST_VERSION_STRING) + " hunt-stream");
      if (simulated) req.set("x-simulated-trading", "1");
    }));
  ws_->text(true);

  ws_->handshake(ep.host, ep.path, ec);
  if (ec) throw TransportError("websocket handshake: " + ec.message());

  logger().log(LogLevel::Info, "ws.open",
               { {"host", ep.host}, {"port", ep.port}, {"path", ep.path} });
}

void WsTransport::send(const std::string& text) {
  if (!isOpen()) throw TransportError("send on closed transport");
  if (write_ && !write_->done) throw TransportError("send while a previous write is stalled");

  auto op = std::make_shared<PendingOp>();
  op->payload = text;
  write_ = op;
  ws_->text(true);
  ws_->async_write(boost::asio::buffer(op->payload),
    [op](ErrorCode ec, std::size_t) { op->ec = ec; op->done = true; });

  if (!pumpUntil(ioc_, op->done, 10s)) {
    abort();
    throw TransportError("send timed out");
  }
  if (op->ec) throw TransportError("send: " + op->ec.message());
}

void WsTransport::ping() {
  if (!isOpen()) throw TransportError("ping on closed transport");
  // Text "ping" is what the exchange answers with "pong".
  send("ping");
}

void WsTransport::startRead() {
  readPending_ = true;
  readDone_ = false;
  ws_->async_read(buffer_, [this](ErrorCode ec, std::size_t) {
    readEc_ = ec;
    readDone_ = true;
  });
}

Received WsTransport::receive(std::chrono::milliseconds timeout) {
  if (!isOpen() && !readPending_) return { RecvStatus::Closed, "not open" };
  if (!readPending_) startRead();

  if (!pumpUntil(ioc_, readDone_, timeout)) return { RecvStatus::Timeout, {} };

  readPending_ = false;
  readDone_ = false;
  if (readEc_) {
    const std::string why = readEc_ == websocket::error::closed ? "closed by peer" : readEc_.message();
    readEc_ = {};
    return { RecvStatus::Closed, why };
  }
  std::string text = beast::buffers_to_string(buffer_.cdata());
  buffer_.consume(buffer_.size());
  return { RecvStatus::Message, std::move(text) };
}

bool pumpUntil(boost::asio::io_context& ioc, const bool& done, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!done) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return false;
    if (ioc.stopped()) ioc.restart();
    ioc.run_one_for(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
  }
  return true;
}

void WsTransport::abort() {
  if (!ws_) return;
  ErrorCode ec;
  beast::get_lowest_layer(*ws_).socket().close(ec);

  // Aborted operations still reference the stream; let them finish first.
  if (readPending_ && !pumpUntil(ioc_, readDone_, 1s)) {
    logger().log(LogLevel::Debug, "ws.read_not_drained", { {"host", host_} });
  }
  if (write_ && !pumpUntil(ioc_, write_->done, 1s)) {
    logger().log(LogLevel::Debug, "ws.write_not_drained", { {"host", host_} });
  }
  if (close_ && !pumpUntil(ioc_, close_->done, 1s)) {
    logger().log(LogLevel::Debug, "ws.close_not_drained", { {"host", host_} });
  }
}

void WsTransport::close() {
  if (!ws_) return;
  // A stalled write owns the write side; skip the close handshake then.
  const bool writeStalled = write_ && !write_->done;
  if (ws_->is_open() && !writeStalled) {
    auto op = std::make_shared<PendingOp>();
    close_ = op;
    ws_->async_close(websocket::close_code::normal,
      [op](ErrorCode ec) { op->ec = ec; op->done = true; });
    if (!pumpUntil(ioc_, op->done, 2s) || op->ec) {
      logger().log(LogLevel::Debug, "ws.close_unclean",
                   { {"host", host_}, {"err", op->ec ? op->ec.message() : "timeout"} });
    }
  }
  abort();
  reset();
}

} // namespace hunt::ws
