#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/common/config/config_manager.hpp"
#include "core/common/logger/logger.hpp"
#include "core/device/model/device_entity.hpp"

namespace vtob {
namespace core {
namespace device {
namespace manager {

// Read/write view of the device records used by the broker connections.
// Implementations must be safe for concurrent use.
class DeviceDirectory {
public:
  virtual ~DeviceDirectory() = default;

  virtual std::vector<model::DeviceEntity> ListVisibleDevices() const = 0;
  virtual std::optional<model::DeviceEntity> FindDeviceByTopic(const std::string& topic) const = 0;
  virtual bool RecordActuation(const std::string& device_id, std::int64_t unix_ms) = 0;
};

class AccountDirectory {
public:
  virtual ~AccountDirectory() = default;

  virtual std::vector<model::TenantAccount> ListEnabledAccounts() const = 0;
};

class DeviceRegistry final : public DeviceDirectory {
public:
  // Fills in the derived topic. Fails on an empty id or address, or when
  // another device already uses the same address.
  bool Register(model::DeviceEntity device);
  bool Remove(const std::string& id);
  bool Has(const std::string& id) const;

  bool Get(const std::string& id, model::DeviceEntity& out) const;
  std::vector<model::DeviceEntity> List() const;
  bool SetVisible(const std::string& id, bool visible);

  std::vector<model::DeviceEntity> ListVisibleDevices() const override;
  std::optional<model::DeviceEntity> FindDeviceByTopic(const std::string& topic) const override;
  bool RecordActuation(const std::string& device_id, std::int64_t unix_ms) override;

  std::string ToJsonList() const;
  bool ToJsonOne(const std::string& id, std::string& out_json) const;

private:
  static std::string DeviceToJson(const model::DeviceEntity& d);
  std::vector<model::DeviceEntity> ListLocked() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, model::DeviceEntity> by_id_;
  std::unordered_map<std::string, std::string> topic_to_id_;
};

class AccountRegistry final : public AccountDirectory {
public:
  bool Register(model::TenantAccount account);
  bool Remove(const std::string& key);
  bool SetEnabled(const std::string& key, bool enabled);

  std::vector<model::TenantAccount> List() const;
  std::vector<model::TenantAccount> ListEnabledAccounts() const override;

private:
  mutable std::mutex mu_;
  std::vector<model::TenantAccount> accounts_;
};

// devices[i].{id,name,address,port,username,password,visible}. Returns the
// number of devices registered; rejected entries are logged.
std::size_t LoadDevices(const common::config::ConfigManager& cfg, DeviceRegistry& registry,
                        const std::shared_ptr<common::log::Logger>& logger);

// accounts[i].{name,key,enabled}
std::size_t LoadAccounts(const common::config::ConfigManager& cfg, AccountRegistry& registry,
                         const std::shared_ptr<common::log::Logger>& logger);

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace vtob
