#include "core/control/door_command.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

#include "core/common/utils/time_utils.hpp"

namespace vtob {
namespace core {
namespace control {

namespace {

const char kOpenToken[] = "\xe6\x89\x93\xe5\xbc\x80";  // 打开

std::string ToLower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

}  // namespace

bool IsOpenCommand(const std::string& payload) {
  if (payload.find(kOpenToken) != std::string::npos) return true;
  const std::string t = ToLower(payload);
  return t == "open" || t == "on";
}

DoorCommandHandler::DoorCommandHandler(std::shared_ptr<device::manager::DeviceDirectory> devices,
                                       std::shared_ptr<device::manager::AccountDirectory> accounts,
                                       std::shared_ptr<cloud::StatusPushback> pushback,
                                       Actuator actuator)
    : devices_(std::move(devices)),
      accounts_(std::move(accounts)),
      pushback_(std::move(pushback)),
      actuator_(std::move(actuator)) {}

DoorCommandOutcome DoorCommandHandler::Execute(const device::model::DeviceEntity& device,
                                               const common::log::TaggedLogger& log) const {
  DoorCommandOutcome out;
  if (!actuator_) {
    out.actuation.message = "no actuator configured";
    log.Error("cannot open " + device.address + ": " + out.actuation.message);
    return out;
  }

  log.Info("open command for " + device.name + " (" + device.address + ")");
  try {
    out.actuation = actuator_(device);
  } catch (const std::exception& e) {
    out.actuation.success = false;
    out.actuation.message = std::string("actuator error: ") + e.what();
  }

  if (!out.actuation.success) {
    log.Error("open " + device.address + " failed" +
              (out.actuation.step.empty() ? std::string() : " at " + out.actuation.step) + ": " +
              out.actuation.message);
    return out;
  }

  if (devices_) {
    out.recorded = devices_->RecordActuation(device.id, common::time::NowUnixMs());
    if (!out.recorded) log.Warn("device " + device.id + " vanished before its actuation was recorded");
  }
  log.Info("device " + device.name + " opened");

  if (pushback_ && accounts_) {
    out.pushes = cloud::NotifyAllAccounts(*pushback_, *accounts_, device, log);
  }
  return out;
}

Actuator MakeVtoActuator(std::shared_ptr<common::http::HttpClient> http, int door_index,
                         std::string short_number, int timeout_ms,
                         std::shared_ptr<common::log::Logger> logger) {
  return [http = std::move(http), door_index, short_number = std::move(short_number), timeout_ms,
          logger = std::move(logger)](const device::model::DeviceEntity& device) {
    device::protocol_adapters::vto::ActuationClient::Options opt;
    opt.host = device.address;
    opt.port = device.port;
    opt.username = device.username;
    opt.password = device.password;
    opt.timeout_ms = timeout_ms;
    device::protocol_adapters::vto::ActuationClient client(opt, http, logger);
    return client.ExecuteOpenFlow(door_index, short_number);
  };
}

}  // namespace control
}  // namespace core
}  // namespace vtob
