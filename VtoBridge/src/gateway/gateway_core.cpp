#include "gateway/gateway_core.hpp"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "core/broker/connection_supervisor.hpp"
#include "core/broker/tenant_connection.hpp"
#include "core/common/config/config_manager.hpp"
#include "core/common/http/http_client.hpp"
#include "core/common/utils/network_utils.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/control/door_command.hpp"
#include "core/device/manager/device_manager.hpp"
#include "core/device/protocol_adapters/mqtt_adapter/mqtt_adapter.hpp"
#include "gateway/settings.hpp"
#include "services/cloud_services/bemfa_pushback.hpp"
#include "services/web_services/http/http_server.hpp"

namespace vtob {
namespace gateway {

namespace vlog = vtob::core::common::log;
namespace broker = vtob::core::broker;
namespace manager = vtob::core::device::manager;

namespace {

std::atomic<bool>& RunningFlag() {
  static std::atomic<bool> running{true};
  return running;
}

void HandleSignal(int) {
  RunningFlag().store(false);
}

std::string ToLower(std::string s) {
  for (char& c : s) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc >= 'A' && uc <= 'Z') c = static_cast<char>(uc - 'A' + 'a');
  }
  return s;
}

std::shared_ptr<vlog::Logger> MakeLogger(const std::string& log_file) {
  if (log_file.empty() || log_file == "-") {
    return std::make_shared<vlog::Logger>(std::make_shared<vlog::ConsoleSink>());
  }

  const std::filesystem::path path(log_file);
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) std::cerr << "cannot create " << path.parent_path().string() << ": " << ec.message() << "\n";
  }
  return std::make_shared<vlog::Logger>(std::make_shared<vlog::FileSink>(path));
}

}  // namespace

std::optional<vlog::Level> ParseLogLevel(std::string_view s) {
  const std::string t = ToLower(std::string(s));
  if (t == "trace") return vlog::Level::Trace;
  if (t == "debug") return vlog::Level::Debug;
  if (t == "info") return vlog::Level::Info;
  if (t == "warn" || t == "warning") return vlog::Level::Warn;
  if (t == "error") return vlog::Level::Error;
  if (t == "fatal") return vlog::Level::Fatal;
  return std::nullopt;
}

int GatewayCore::Run(const Args& args) {
  if (args.print_version) {
    std::cout << kVersion << "\n";
    return 0;
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  vtob::core::common::config::ConfigManager cfg;
  if (!args.config_yaml.empty() && !cfg.LoadYamlFile(args.config_yaml)) {
    std::cerr << "failed to load " << args.config_yaml << ": " << cfg.LastError() << "\n";
    return 2;
  }
  const Settings settings = LoadSettings(cfg);

  auto logger = MakeLogger(args.log_file.empty() ? settings.log_file : args.log_file);
  const std::string level = args.log_level.empty() ? settings.log_level : args.log_level;
  if (const auto lvl = ParseLogLevel(level); lvl.has_value()) {
    logger->SetLevel(*lvl);
  } else {
    logger->Warn("unknown log level '" + level + "', keeping info");
  }

  logger->Info(std::string("vto_bridge ") + kVersion + " starting");
  for (const auto& e : vtob::core::common::config::ValidateRequiredKeys(cfg, {"accounts[0].key", "devices[0].address"})) {
    logger->Warn(e);
  }

  auto devices = std::make_shared<manager::DeviceRegistry>();
  auto accounts = std::make_shared<manager::AccountRegistry>();
  const std::size_t n_devices = manager::LoadDevices(cfg, *devices, logger);
  const std::size_t n_accounts = manager::LoadAccounts(cfg, *accounts, logger);
  logger->Info("loaded " + std::to_string(n_devices) + " devices, " + std::to_string(n_accounts) + " accounts");

  auto http = std::make_shared<vtob::core::common::http::MongooseHttpClient>();

  vtob::services::cloud_services::BemfaPushback::Options push_opt;
  push_opt.url = settings.pushback_url;
  auto pushback = std::make_shared<vtob::services::cloud_services::BemfaPushback>(push_opt, http, logger);

  auto commands = std::make_shared<vtob::core::control::DoorCommandHandler>(
      devices, accounts, pushback,
      vtob::core::control::MakeVtoActuator(http, settings.vto.door_index, settings.vto.short_number,
                                           settings.vto.timeout_ms, logger));

  broker::TenantConnection::Dependencies deps;
  deps.devices = devices;
  deps.commands = commands;
  deps.transport_factory = [logger] {
    return std::make_unique<vtob::core::device::protocol_adapters::mqtt::MqttClient>(logger);
  };
  deps.probe = vtob::core::common::net::ProbeTcp;
  deps.logger = logger;

  const broker::ConnectionOptions conn_opt = settings.mqtt;
  auto supervisor = std::make_shared<broker::ConnectionSupervisor>(
      settings.supervisor, accounts,
      [deps, conn_opt](const vtob::core::device::model::TenantAccount& account) {
        return std::make_shared<broker::TenantConnection>(account.key, conn_opt, deps);
      },
      logger);

  const std::size_t started = supervisor->StartAll();
  logger->Info(std::to_string(started) + " broker connections started");
  (void)supervisor->StartReconcileLoop();

  vtob::services::web_services::api::ApiContext ctx;
  ctx.version = kVersion;
  ctx.supervisor = supervisor.get();
  ctx.device_registry = devices.get();
  ctx.commands = commands.get();
  ctx.logger = logger;

  vtob::services::web_services::http::MongooseServer::Options web_opt;
  web_opt.listen_addr = settings.http_listen;
  vtob::services::web_services::http::MongooseServer web_server(web_opt, ctx, logger);
  const bool web_ok = web_server.Start();

  std::int64_t last_flush_ms = 0;
  while (RunningFlag().load()) {
    if (web_ok) {
      web_server.Poll(100);
    } else {
      vtob::core::common::time::SleepMs(100);
    }

    const auto now = vtob::core::common::time::NowUnixMs();
    if (now - last_flush_ms >= 10'000) {
      last_flush_ms = now;
      logger->Flush();
    }
  }

  logger->Info("vto_bridge stopping");
  supervisor->StopReconcileLoop();
  supervisor->StopAll();
  logger->Info("vto_bridge stopped");
  logger->Flush();
  return 0;
}

}  // namespace gateway
}  // namespace vtob
