#pragma once

#include <cstdint>
#include <string>

namespace vtob {
namespace core {
namespace device {
namespace model {

// One door station. topic is always DeriveTopic(address).
struct DeviceEntity {
  std::string id;
  std::string name;
  std::string address;
  std::uint16_t port = 80;
  std::string username = "admin";
  std::string password = "admin123";
  std::string topic;
  bool visible = false;
  std::int64_t last_actuation_ms = 0;
};

struct TenantAccount {
  std::string name;
  std::string key;
  bool enabled = true;
};

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace vtob
