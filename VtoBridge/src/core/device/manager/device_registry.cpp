#include "core/device/manager/device_manager.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/model/topic.hpp"

namespace vtob {
namespace core {
namespace device {
namespace manager {

namespace json = vtob::core::common::json;

bool DeviceRegistry::Register(model::DeviceEntity device) {
  if (device.id.empty() || device.address.empty()) return false;
  device.topic = model::DeriveTopic(device.address);

  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& kv : by_id_) {
    if (kv.first != device.id && kv.second.address == device.address) return false;
  }
  const auto owner = topic_to_id_.find(device.topic);
  if (owner != topic_to_id_.end() && owner->second != device.id) return false;

  const std::string id = device.id;
  auto it = by_id_.find(id);
  if (it != by_id_.end()) {
    topic_to_id_.erase(it->second.topic);
    const std::int64_t last = it->second.last_actuation_ms;
    it->second = std::move(device);
    if (it->second.last_actuation_ms == 0) it->second.last_actuation_ms = last;
  } else {
    it = by_id_.emplace(id, std::move(device)).first;
  }

  topic_to_id_[it->second.topic] = id;
  return true;
}

bool DeviceRegistry::Remove(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = by_id_.find(id);
  if (it == by_id_.end()) return false;
  topic_to_id_.erase(it->second.topic);
  by_id_.erase(it);
  return true;
}

bool DeviceRegistry::Has(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  return by_id_.find(id) != by_id_.end();
}

bool DeviceRegistry::Get(const std::string& id, model::DeviceEntity& out) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = by_id_.find(id);
  if (it == by_id_.end()) return false;
  out = it->second;
  return true;
}

std::vector<model::DeviceEntity> DeviceRegistry::ListLocked() const {
  std::vector<model::DeviceEntity> out;
  out.reserve(by_id_.size());
  for (const auto& kv : by_id_) out.push_back(kv.second);
  std::sort(out.begin(), out.end(), [](const model::DeviceEntity& a, const model::DeviceEntity& b) {
    return a.id < b.id;
  });
  return out;
}

std::vector<model::DeviceEntity> DeviceRegistry::List() const {
  std::lock_guard<std::mutex> lk(mu_);
  return ListLocked();
}

bool DeviceRegistry::SetVisible(const std::string& id, bool visible) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = by_id_.find(id);
  if (it == by_id_.end()) return false;
  it->second.visible = visible;
  return true;
}

std::vector<model::DeviceEntity> DeviceRegistry::ListVisibleDevices() const {
  std::lock_guard<std::mutex> lk(mu_);
  auto all = ListLocked();
  all.erase(std::remove_if(all.begin(), all.end(),
                           [](const model::DeviceEntity& d) { return !d.visible || d.topic.empty(); }),
            all.end());
  return all;
}

std::optional<model::DeviceEntity> DeviceRegistry::FindDeviceByTopic(const std::string& topic) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = topic_to_id_.find(topic);
  if (it == topic_to_id_.end()) return std::nullopt;
  const auto dit = by_id_.find(it->second);
  if (dit == by_id_.end()) return std::nullopt;
  return dit->second;
}

bool DeviceRegistry::RecordActuation(const std::string& device_id, std::int64_t unix_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = by_id_.find(device_id);
  if (it == by_id_.end()) return false;
  it->second.last_actuation_ms = unix_ms;
  return true;
}

std::string DeviceRegistry::DeviceToJson(const model::DeviceEntity& d) {
  return json::Object({
      {"id", json::Quote(d.id)},
      {"name", json::Quote(d.name)},
      {"address", json::Quote(d.address)},
      {"topic", json::Quote(d.topic)},
      {"visible", json::Bool(d.visible)},
      {"last_actuation_ms", json::Number(d.last_actuation_ms)},
      {"last_actuation", json::Quote(common::time::ToIso8601Utc(d.last_actuation_ms))},
  });
}

std::string DeviceRegistry::ToJsonList() const {
  const auto list = List();
  std::vector<std::string> items;
  items.reserve(list.size());
  for (const auto& d : list) items.push_back(DeviceToJson(d));
  return json::Array(items);
}

bool DeviceRegistry::ToJsonOne(const std::string& id, std::string& out_json) const {
  model::DeviceEntity d;
  if (!Get(id, d)) return false;
  out_json = DeviceToJson(d);
  return true;
}

std::size_t LoadDevices(const common::config::ConfigManager& cfg, DeviceRegistry& registry,
                        const std::shared_ptr<common::log::Logger>& logger) {
  std::size_t loaded = 0;
  const std::size_t n = cfg.SequenceSize("devices");
  for (std::size_t i = 0; i < n; ++i) {
    const std::string p = "devices[" + std::to_string(i) + "].";

    model::DeviceEntity d;
    d.address = cfg.GetStringOr(p + "address", "");
    d.id = cfg.GetStringOr(p + "id", d.address);
    d.name = cfg.GetStringOr(p + "name", d.id);
    d.username = cfg.GetStringOr(p + "username", d.username);
    d.password = cfg.GetStringOr(p + "password", d.password);
    d.visible = cfg.GetBoolOr(p + "visible", false);
    const std::int64_t port = cfg.GetInt64Or(p + "port", cfg.GetInt64Or("vto.port", d.port));
    if (port > 0 && port <= 65535) d.port = static_cast<std::uint16_t>(port);

    if (registry.Register(d)) {
      ++loaded;
    } else if (logger) {
      logger->Warn("device entry " + std::to_string(i) + " rejected (address '" + d.address +
                   "' missing or duplicate)");
    }
  }
  return loaded;
}

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace vtob
