#include "core/device/manager/device_manager.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace vtob::core::device::manager {

bool AccountRegistry::Register(model::TenantAccount account) {
  if (account.key.empty()) return false;
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& a : accounts_) {
    if (a.key == account.key) {
      a = std::move(account);
      return true;
    }
  }
  accounts_.push_back(std::move(account));
  return true;
}

bool AccountRegistry::Remove(const std::string& key) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = std::find_if(accounts_.begin(), accounts_.end(),
                               [&](const model::TenantAccount& a) { return a.key == key; });
  if (it == accounts_.end()) return false;
  accounts_.erase(it);
  return true;
}

bool AccountRegistry::SetEnabled(const std::string& key, bool enabled) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto& a : accounts_) {
    if (a.key == key) {
      a.enabled = enabled;
      return true;
    }
  }
  return false;
}

std::vector<model::TenantAccount> AccountRegistry::List() const {
  std::lock_guard<std::mutex> lk(mu_);
  return accounts_;
}

std::vector<model::TenantAccount> AccountRegistry::ListEnabledAccounts() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<model::TenantAccount> out;
  for (const auto& a : accounts_) {
    if (a.enabled) out.push_back(a);
  }
  return out;
}

std::size_t LoadAccounts(const common::config::ConfigManager& cfg, AccountRegistry& registry,
                         const std::shared_ptr<common::log::Logger>& logger) {
  std::size_t loaded = 0;
  const std::size_t n = cfg.SequenceSize("accounts");
  for (std::size_t i = 0; i < n; ++i) {
    const std::string p = "accounts[" + std::to_string(i) + "].";

    model::TenantAccount a;
    a.key = cfg.GetStringOr(p + "key", "");
    a.name = cfg.GetStringOr(p + "name", a.key);
    a.enabled = cfg.GetBoolOr(p + "enabled", true);

    if (registry.Register(a)) {
      ++loaded;
    } else if (logger) {
      logger->Warn("account entry " + std::to_string(i) + " has no key, skipped");
    }
  }
  return loaded;
}

}  // namespace vtob::core::device::manager
