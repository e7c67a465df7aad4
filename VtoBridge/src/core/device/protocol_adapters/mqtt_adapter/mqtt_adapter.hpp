#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "mongoose.h"
#include "core/common/logger/logger.hpp"
#include "core/device/protocol_adapters/mqtt_adapter/broker_transport.hpp"

namespace vtob::core::device::protocol_adapters::mqtt {

// BrokerTransport over a private mongoose manager. PINGRESP is reported as
// a heartbeat; pings are only sent when Ping() is called.
class MqttClient final : public BrokerTransport {
public:
  explicit MqttClient(std::shared_ptr<vtob::core::common::log::Logger> logger);
  ~MqttClient() override;

  MqttClient(const MqttClient&) = delete;
  MqttClient& operator=(const MqttClient&) = delete;

  void SetListener(BrokerListener* listener) override;

  bool Connect(const Options& opt) override;
  void Close() override;
  bool IsConnected() const override;

  bool Subscribe(const std::string& topic) override;
  bool Unsubscribe(const std::string& topic) override;
  bool Ping() override;

  void Poll(int timeout_ms) override;

private:
  static void EventHandler(struct mg_connection* c, int ev, void* ev_data);
  void HandleEvent(struct mg_connection* c, int ev, void* ev_data);
  std::uint16_t NextPacketId();

private:
  struct mg_mgr mgr_;
  struct mg_connection* conn_ = nullptr;
  Options opt_;
  std::string url_;
  bool open_ = false;
  bool closing_ = false;
  std::string last_error_;
  std::uint16_t packet_id_ = 0;
  BrokerListener* listener_ = nullptr;
  std::shared_ptr<vtob::core::common::log::Logger> logger_;
};

}  // namespace vtob::core::device::protocol_adapters::mqtt
