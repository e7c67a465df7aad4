#include "core/cloud/status_pushback.hpp"

#include <exception>

namespace vtob::core::cloud {

std::vector<AccountPushOutcome> NotifyAllAccounts(
    StatusPushback& pushback, const device::manager::AccountDirectory& accounts,
    const device::model::DeviceEntity& device, const common::log::TaggedLogger& log) {
  std::vector<AccountPushOutcome> out;
  const auto enabled = accounts.ListEnabledAccounts();
  if (enabled.empty()) return out;

  const std::string human = "device " + device.name + " unlocked, current state: closed";

  out.reserve(enabled.size());
  for (const auto& account : enabled) {
    AccountPushOutcome o;
    o.account_name = account.name;
    o.account_key = account.key;
    try {
      o.result = pushback.SendStatus(account.key, device.topic, kClosedStatus, human);
    } catch (const std::exception& e) {
      o.result.code = -1;
      o.result.message = e.what();
    }

    if (o.result.Ok()) {
      log.Info("status pushed to account " + account.name + " for " + device.topic);
    } else {
      log.Error("status push to account " + account.name + " failed (code " +
                std::to_string(o.result.code) + "): " + o.result.message);
    }
    out.push_back(std::move(o));
  }
  return out;
}

}  // namespace vtob::core::cloud
