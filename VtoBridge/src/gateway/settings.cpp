#include "gateway/settings.hpp"

#include <cstdint>

namespace vtob {
namespace gateway {

namespace {

void ReadPositive(const vtob::core::common::config::ConfigManager& cfg, const std::string& key,
                  std::int64_t& out) {
  std::int64_t v = 0;
  if (cfg.GetInt64(key, v) && v > 0) out = v;
}

void ReadPositive(const vtob::core::common::config::ConfigManager& cfg, const std::string& key, int& out) {
  std::int64_t v = 0;
  if (cfg.GetInt64(key, v) && v > 0 && v <= INT32_MAX) out = static_cast<int>(v);
}

}  // namespace

Settings LoadSettings(const vtob::core::common::config::ConfigManager& cfg) {
  Settings s;
  s.log_file = cfg.GetStringOr("log_file", s.log_file);
  s.log_level = cfg.GetStringOr("log_level", s.log_level);
  s.http_listen = cfg.GetStringOr("http_listen", s.http_listen);
  s.pushback_url = cfg.GetStringOr("pushback.url", s.pushback_url);

  auto& m = s.mqtt;
  m.host = cfg.GetStringOr("mqtt.host", m.host);
  const std::int64_t port = cfg.GetInt64Or("mqtt.port", m.port);
  if (port > 0 && port <= 65535) m.port = static_cast<std::uint16_t>(port);
  const std::int64_t keepalive = cfg.GetInt64Or("mqtt.keepalive_sec", m.keepalive_sec);
  if (keepalive > 0 && keepalive <= 65535) m.keepalive_sec = static_cast<std::uint16_t>(keepalive);

  ReadPositive(cfg, "mqtt.heartbeat_interval_ms", m.heartbeat_interval_ms);
  ReadPositive(cfg, "mqtt.heartbeat_timeout_ms", m.heartbeat_timeout_ms);
  ReadPositive(cfg, "mqtt.health_check_interval_ms", m.health_check_interval_ms);
  ReadPositive(cfg, "mqtt.reconnect_base_ms", m.reconnect_base_ms);
  ReadPositive(cfg, "mqtt.reconnect_max_ms", m.reconnect_max_ms);
  ReadPositive(cfg, "mqtt.connect_wait_ms", m.connect_wait_ms);
  ReadPositive(cfg, "mqtt.probe_timeout_ms", m.probe_timeout_ms);
  ReadPositive(cfg, "mqtt.join_timeout_ms", m.join_timeout_ms);

  std::int64_t max_attempts = 0;
  if (cfg.GetInt64("mqtt.reconnect_max_attempts", max_attempts) && max_attempts >= 0) {
    m.max_reconnect_attempts = max_attempts;
  }

  ReadPositive(cfg, "supervisor.reconcile_interval_ms", s.supervisor.reconcile_interval_ms);
  s.supervisor.join_timeout_ms = m.join_timeout_ms;

  s.vto.short_number = cfg.GetStringOr("vto.short_number", s.vto.short_number);
  std::int64_t door = 0;
  if (cfg.GetInt64("vto.door_index", door) && door >= 0 && door <= INT32_MAX) {
    s.vto.door_index = static_cast<int>(door);
  }
  ReadPositive(cfg, "vto.timeout_ms", s.vto.timeout_ms);
  return s;
}

}  // namespace gateway
}  // namespace vtob
