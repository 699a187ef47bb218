#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace hunt::ws {

struct Endpoint {
  std::string host;
  std::string port = "443";
  std::string path = "/";
  bool simulated   = false;   // adds the paper-trading header
};

enum class RecvStatus { Message, Timeout, Closed };

struct Received {
  RecvStatus  status = RecvStatus::Timeout;
  std::string text;           // frame on Message, reason on Closed
};

class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Blocking text-frame channel used by the stream client. Implementations
// throw TransportError from open()/send()/ping() on failure.
class Transport {
public:
  virtual ~Transport() = default;

  virtual void open(const Endpoint& ep) = 0;
  virtual void send(const std::string& text) = 0;
  // A timeout leaves any read in flight for the next call.
  virtual Received receive(std::chrono::milliseconds timeout) = 0;
  virtual void ping() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

} // namespace hunt::ws
