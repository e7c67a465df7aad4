#pragma once

#include <string>

#include "core/broker/connection_supervisor.hpp"
#include "core/broker/tenant_connection.hpp"
#include "core/common/config/config_manager.hpp"

#ifndef VTOB_VERSION
#define VTOB_VERSION "0.0.0-dev"
#endif

namespace vtob {
namespace gateway {

inline constexpr const char* kVersion = VTOB_VERSION;

struct VtoSettings {
  std::string short_number = "04001010001";
  int door_index = 0;
  int timeout_ms = 10000;
};

struct Settings {
  std::string log_file = "logs/vto_bridge.log";
  std::string log_level = "info";
  std::string http_listen = "http://0.0.0.0:8000";
  std::string pushback_url = "https://apis.bemfa.com/va/postJsonMsg";

  vtob::core::broker::ConnectionOptions mqtt;
  vtob::core::broker::SupervisorOptions supervisor;
  VtoSettings vto;
};

// Missing or malformed keys keep their defaults.
Settings LoadSettings(const vtob::core::common::config::ConfigManager& cfg);

}  // namespace gateway
}  // namespace vtob
