#include "core/device/protocol_adapters/mqtt_adapter/mqtt_adapter.hpp"

#include <utility>

#include "core/common/utils/network_utils.hpp"

namespace vtob::core::device::protocol_adapters::mqtt {

MqttClient::MqttClient(std::shared_ptr<vtob::core::common::log::Logger> logger)
    : logger_(std::move(logger)) {
  mg_mgr_init(&mgr_);
}

MqttClient::~MqttClient() {
  listener_ = nullptr;
  mg_mgr_free(&mgr_);
}

void MqttClient::SetListener(BrokerListener* listener) { listener_ = listener; }

bool MqttClient::Connect(const Options& opt) {
  opt_ = opt;
  url_ = "mqtt://" + vtob::core::common::net::JoinHostPort(opt_.host, opt_.port);
  open_ = false;
  closing_ = false;
  last_error_.clear();

  mg_mqtt_opts mo{};
  mo.client_id = mg_str(opt_.client_id.c_str());
  mo.keepalive = opt_.keepalive_sec;
  mo.clean = opt_.clean_session;
  mo.version = 4;

  conn_ = mg_mqtt_connect(&mgr_, url_.c_str(), &mo, EventHandler, this);
  if (conn_ == nullptr) {
    if (logger_) logger_->Error("MQTT connect failed: " + url_);
    return false;
  }
  if (logger_) logger_->Debug("MQTT connecting: " + url_);
  return true;
}

void MqttClient::Close() {
  if (conn_ == nullptr) return;
  closing_ = true;
  if (open_) {
    mg_mqtt_opts mo{};
    mg_mqtt_disconnect(conn_, &mo);
  }
  conn_->is_draining = 1;
}

bool MqttClient::IsConnected() const { return conn_ != nullptr && open_ && !closing_; }

bool MqttClient::Subscribe(const std::string& topic) {
  if (topic.empty() || !IsConnected()) return false;

  mg_mqtt_opts sub{};
  sub.topic = mg_str(topic.c_str());
  sub.qos = 0;
  mg_mqtt_sub(conn_, &sub);
  return true;
}

// mongoose has no UNSUBSCRIBE helper; the packet is small enough to write
// by hand (MQTT 3.1.1 section 3.10).
bool MqttClient::Unsubscribe(const std::string& topic) {
  if (topic.empty() || topic.size() > 0xffff || !IsConnected()) return false;

  const std::uint16_t id = NextPacketId();
  const std::uint16_t tlen = static_cast<std::uint16_t>(topic.size());
  const std::uint8_t head[4] = {
      static_cast<std::uint8_t>(id >> 8), static_cast<std::uint8_t>(id & 0xff),
      static_cast<std::uint8_t>(tlen >> 8), static_cast<std::uint8_t>(tlen & 0xff)};

  mg_mqtt_send_header(conn_, MQTT_CMD_UNSUBSCRIBE, 2, static_cast<std::uint32_t>(4 + topic.size()));
  mg_send(conn_, head, sizeof(head));
  mg_send(conn_, topic.data(), topic.size());
  return true;
}

bool MqttClient::Ping() {
  if (!IsConnected()) return false;
  mg_mqtt_ping(conn_);
  return true;
}

void MqttClient::Poll(int timeout_ms) { mg_mgr_poll(&mgr_, timeout_ms); }

std::uint16_t MqttClient::NextPacketId() {
  if (++packet_id_ == 0) packet_id_ = 1;
  return packet_id_;
}

void MqttClient::EventHandler(struct mg_connection* c, int ev, void* ev_data) {
  auto* self = static_cast<MqttClient*>(c->fn_data);
  if (self != nullptr) self->HandleEvent(c, ev, ev_data);
}

void MqttClient::HandleEvent(struct mg_connection* c, int ev, void* ev_data) {
  if (c != conn_) return;

  if (ev == MG_EV_MQTT_OPEN) {
    const int* code = static_cast<const int*>(ev_data);
    const int rc = code != nullptr ? *code : -1;
    open_ = (rc == 0);
    if (!open_) {
      last_error_ = "connack refused, code " + std::to_string(rc);
      if (logger_) logger_->Error("MQTT " + last_error_);
    }
    if (listener_) listener_->OnConnect(open_, rc);
    if (!open_) c->is_draining = 1;
  } else if (ev == MG_EV_MQTT_MSG) {
    const auto* mm = static_cast<const mg_mqtt_message*>(ev_data);
    if (mm == nullptr) return;
    const std::string topic(mm->topic.buf, mm->topic.len);
    const std::string payload(mm->data.buf, mm->data.len);
    if (listener_) listener_->OnMessage(topic, payload);
  } else if (ev == MG_EV_MQTT_CMD) {
    const auto* mm = static_cast<const mg_mqtt_message*>(ev_data);
    if (mm != nullptr && mm->cmd == MQTT_CMD_PINGRESP && listener_) listener_->OnHeartbeat();
  } else if (ev == MG_EV_ERROR) {
    const char* err = static_cast<const char*>(ev_data);
    last_error_ = err != nullptr ? err : "unknown";
    if (logger_) logger_->Warn("MQTT error: " + last_error_);
  } else if (ev == MG_EV_CLOSE) {
    const bool graceful = closing_;
    open_ = false;
    conn_ = nullptr;
    if (listener_) {
      listener_->OnDisconnect(graceful, last_error_.empty() ? std::string("closed") : last_error_);
    }
  }
}

}  // namespace vtob::core::device::protocol_adapters::mqtt
