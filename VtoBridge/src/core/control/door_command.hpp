#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/cloud/status_pushback.hpp"
#include "core/common/logger/logger.hpp"
#include "core/device/manager/device_manager.hpp"
#include "core/device/model/device_entity.hpp"
#include "core/device/protocol_adapters/vto_adapter/actuation_client.hpp"

namespace vtob {
namespace core {
namespace control {

using ActuationResult = device::protocol_adapters::vto::ActuationResult;

// Performs the physical open for one device. Blocks on network I/O.
using Actuator = std::function<ActuationResult(const device::model::DeviceEntity& device)>;

// "open" and "on" match case-insensitively as the whole payload; the
// Chinese "打开" matches anywhere in it.
bool IsOpenCommand(const std::string& payload);

struct DoorCommandOutcome {
  ActuationResult actuation;
  bool recorded = false;
  std::vector<cloud::AccountPushOutcome> pushes;
};

// Actuate, then record the time and notify every enabled account. Nothing
// is recorded or pushed when the actuation fails.
class DoorCommandHandler {
public:
  DoorCommandHandler(std::shared_ptr<device::manager::DeviceDirectory> devices,
                     std::shared_ptr<device::manager::AccountDirectory> accounts,
                     std::shared_ptr<cloud::StatusPushback> pushback, Actuator actuator);

  DoorCommandOutcome Execute(const device::model::DeviceEntity& device,
                             const common::log::TaggedLogger& log) const;

  const std::shared_ptr<device::manager::DeviceDirectory>& Devices() const { return devices_; }

private:
  std::shared_ptr<device::manager::DeviceDirectory> devices_;
  std::shared_ptr<device::manager::AccountDirectory> accounts_;
  std::shared_ptr<cloud::StatusPushback> pushback_;
  Actuator actuator_;
};

// Builds an ActuationClient per call against the device's own address and
// credentials.
Actuator MakeVtoActuator(std::shared_ptr<common::http::HttpClient> http, int door_index,
                         std::string short_number, int timeout_ms,
                         std::shared_ptr<common::log::Logger> logger);

}  // namespace control
}  // namespace core
}  // namespace vtob
