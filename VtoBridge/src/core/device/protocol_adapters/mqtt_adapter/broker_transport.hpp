#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace vtob::core::device::protocol_adapters::mqtt {

// Callbacks from a BrokerTransport. Delivered one at a time, on the thread
// that calls BrokerTransport::Poll.
class BrokerListener {
public:
  virtual ~BrokerListener() = default;

  virtual void OnConnect(bool accepted, int code) = 0;
  virtual void OnMessage(const std::string& topic, const std::string& payload) = 0;
  // graceful is true only for a close requested through Close().
  virtual void OnDisconnect(bool graceful, const std::string& reason) = 0;
  virtual void OnHeartbeat() = 0;
};

// One pub/sub session with the broker. Not thread-safe: the owner drives
// every call, Poll included, from a single thread.
class BrokerTransport {
public:
  struct Options {
    std::string host;
    std::uint16_t port = 0;
    std::string client_id;
    std::uint16_t keepalive_sec = 60;
    bool clean_session = true;
  };

  virtual ~BrokerTransport() = default;

  virtual void SetListener(BrokerListener* listener) = 0;

  // Starts an asynchronous connect; the outcome arrives via OnConnect or
  // OnDisconnect. False when the attempt could not even be started.
  virtual bool Connect(const Options& opt) = 0;
  virtual void Close() = 0;
  virtual bool IsConnected() const = 0;

  virtual bool Subscribe(const std::string& topic) = 0;
  virtual bool Unsubscribe(const std::string& topic) = 0;
  virtual bool Ping() = 0;

  virtual void Poll(int timeout_ms) = 0;
};

using TransportFactory = std::function<std::unique_ptr<BrokerTransport>()>;

}  // namespace vtob::core::device::protocol_adapters::mqtt
