#pragma once

#include <memory>
#include <string>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/device/manager/device_manager.hpp"
#include "core/device/model/device_entity.hpp"

namespace vtob::core::cloud {

// Status reported after a successful open: the lock has re-latched.
inline constexpr const char* kClosedStatus = "off";

struct PushResult {
  int code = -1;  // 0 is success
  std::string message;

  bool Ok() const { return code == 0; }
};

// Write-only notification channel to the cloud side. Never throws; transport
// problems come back as a non-zero code.
class StatusPushback {
public:
  virtual ~StatusPushback() = default;

  virtual PushResult SendStatus(const std::string& account_key, const std::string& topic,
                                const std::string& status, const std::string& human_message) = 0;
};

struct AccountPushOutcome {
  std::string account_name;
  std::string account_key;
  PushResult result;
};

// One SendStatus per enabled account. Failures are logged per account and
// never stop delivery to the remaining accounts.
std::vector<AccountPushOutcome> NotifyAllAccounts(
    StatusPushback& pushback, const device::manager::AccountDirectory& accounts,
    const device::model::DeviceEntity& device, const common::log::TaggedLogger& log);

}  // namespace vtob::core::cloud
