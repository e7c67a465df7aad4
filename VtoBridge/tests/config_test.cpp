#include <string>

#include <gtest/gtest.h>

#include "core/common/config/config_manager.hpp"
#include "core/device/manager/device_manager.hpp"
#include "gateway/gateway_core.hpp"
#include "gateway/settings.hpp"

namespace config = vtob::core::common::config;
namespace manager = vtob::core::device::manager;

namespace {

const char kYaml[] = R"(
log_level: debug
http_listen: http://127.0.0.1:8080
mqtt:
  host: broker.local
  port: 1883
  reconnect_base_ms: 1000
  reconnect_max_attempts: 5
supervisor:
  reconcile_interval_ms: 30000
vto:
  short_number: "05002020002"
  door_index: 1
  port: 8080
accounts:
  - name: home
    key: 0123456789abcdef
  - name: office
    key: fedcba9876543210
    enabled: false
devices:
  - id: front
    name: Front door
    address: 172.16.11.1
    username: admin
    password: secret
    visible: true
  - id: back
    address: 172.16.11.2
    port: 80
  - id: clash
    address: 172.16.11.1
)";

}  // namespace

TEST(ConfigManager, FlattensYamlIntoDottedKeys) {
  config::ConfigManager cfg;
  ASSERT_TRUE(cfg.LoadYamlString(kYaml)) << cfg.LastError();

  EXPECT_EQ(cfg.GetStringOr("mqtt.host", ""), "broker.local");
  EXPECT_EQ(cfg.GetInt64Or("mqtt.port", 0), 1883);
  EXPECT_EQ(cfg.GetStringOr("accounts[1].name", ""), "office");
  EXPECT_FALSE(cfg.GetBoolOr("accounts[1].enabled", true));
  EXPECT_EQ(cfg.SequenceSize("accounts"), 2u);
  EXPECT_EQ(cfg.SequenceSize("devices"), 3u);
  EXPECT_EQ(cfg.SequenceSize("nothing"), 0u);
}

TEST(ConfigManager, RejectsEmptyAndBrokenDocuments) {
  config::ConfigManager cfg;
  EXPECT_FALSE(cfg.LoadYamlString(""));
  EXPECT_FALSE(cfg.LastError().empty());
  EXPECT_FALSE(cfg.LoadYamlFile("/nonexistent/vto_bridge.yaml"));
}

TEST(ConfigManager, ReportsMissingRequiredKeys) {
  config::ConfigManager cfg;
  ASSERT_TRUE(cfg.LoadYamlString(kYaml));
  const auto errors = config::ValidateRequiredKeys(cfg, {"mqtt.host", "pushback.url"});
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("pushback.url"), std::string::npos);
}

TEST(Settings, AppliesOverridesAndKeepsDefaults) {
  config::ConfigManager cfg;
  ASSERT_TRUE(cfg.LoadYamlString(kYaml));
  const auto s = vtob::gateway::LoadSettings(cfg);

  EXPECT_EQ(s.log_level, "debug");
  EXPECT_EQ(s.http_listen, "http://127.0.0.1:8080");
  EXPECT_EQ(s.mqtt.host, "broker.local");
  EXPECT_EQ(s.mqtt.port, 1883);
  EXPECT_EQ(s.mqtt.reconnect_base_ms, 1000);
  EXPECT_EQ(s.mqtt.reconnect_max_ms, 60000);
  EXPECT_EQ(s.mqtt.max_reconnect_attempts, 5);
  EXPECT_EQ(s.mqtt.heartbeat_interval_ms, 30000);
  EXPECT_EQ(s.mqtt.heartbeat_timeout_ms, 15000);
  EXPECT_EQ(s.mqtt.health_check_interval_ms, 15000);
  EXPECT_EQ(s.supervisor.reconcile_interval_ms, 30000);
  EXPECT_EQ(s.vto.short_number, "05002020002");
  EXPECT_EQ(s.vto.door_index, 1);
  EXPECT_EQ(s.pushback_url, "https://apis.bemfa.com/va/postJsonMsg");
}

TEST(Settings, EmptyConfigGivesDefaults) {
  config::ConfigManager cfg;
  const auto s = vtob::gateway::LoadSettings(cfg);
  EXPECT_EQ(s.mqtt.host, "bemfa.com");
  EXPECT_EQ(s.mqtt.port, 9501);
  EXPECT_EQ(s.mqtt.reconnect_base_ms, 3000);
  EXPECT_EQ(s.supervisor.reconcile_interval_ms, 60000);
  EXPECT_EQ(s.vto.short_number, "04001010001");
  EXPECT_EQ(s.vto.door_index, 0);
}

TEST(LoadDevices, RegistersValidEntriesAndSkipsClashes) {
  config::ConfigManager cfg;
  ASSERT_TRUE(cfg.LoadYamlString(kYaml));
  manager::DeviceRegistry reg;

  EXPECT_EQ(manager::LoadDevices(cfg, reg, nullptr), 2u);

  vtob::core::device::model::DeviceEntity front;
  ASSERT_TRUE(reg.Get("front", front));
  EXPECT_EQ(front.name, "Front door");
  EXPECT_EQ(front.password, "secret");
  EXPECT_EQ(front.port, 8080);
  EXPECT_TRUE(front.visible);
  EXPECT_EQ(front.topic, "vto172161101006");

  vtob::core::device::model::DeviceEntity back;
  ASSERT_TRUE(reg.Get("back", back));
  EXPECT_EQ(back.port, 80);
  EXPECT_FALSE(back.visible);
  EXPECT_EQ(back.username, "admin");
}

TEST(LoadAccounts, DefaultsToEnabled) {
  config::ConfigManager cfg;
  ASSERT_TRUE(cfg.LoadYamlString(kYaml));
  manager::AccountRegistry reg;

  EXPECT_EQ(manager::LoadAccounts(cfg, reg, nullptr), 2u);
  const auto enabled = reg.ListEnabledAccounts();
  ASSERT_EQ(enabled.size(), 1u);
  EXPECT_EQ(enabled[0].name, "home");
  EXPECT_EQ(enabled[0].key, "0123456789abcdef");
}

TEST(ParseLogLevel, AcceptsNamesCaseInsensitively) {
  using vtob::core::common::log::Level;
  EXPECT_EQ(vtob::gateway::ParseLogLevel("debug"), Level::Debug);
  EXPECT_EQ(vtob::gateway::ParseLogLevel("WARNING"), Level::Warn);
  EXPECT_EQ(vtob::gateway::ParseLogLevel("Error"), Level::Error);
  EXPECT_FALSE(vtob::gateway::ParseLogLevel("verbose").has_value());
}
