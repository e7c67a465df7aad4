#pragma once

#include <map>
#include <memory>
#include <string>

#include "mongoose.h"

#include "core/broker/connection_supervisor.hpp"
#include "core/common/logger/logger.hpp"
#include "core/control/door_command.hpp"
#include "core/device/manager/device_manager.hpp"

namespace vtob {
namespace services {
namespace web_services {
namespace api {

struct ApiContext {
    std::string base_path = "/api";
    std::string version;

    vtob::core::broker::ConnectionSupervisor* supervisor = nullptr;
    vtob::core::device::manager::DeviceRegistry* device_registry = nullptr;
    vtob::core::control::DoorCommandHandler* commands = nullptr;

    std::shared_ptr<vtob::core::common::log::Logger> logger;
};

bool HandleHttpRequest(struct mg_connection* c, struct mg_http_message* hm, const ApiContext& ctx);

bool HandleSystemApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx);

bool HandleConnectionApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                         const ApiContext& ctx);

bool HandleDeviceApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx);

// {"connected":..,"connections":{"<key prefix>":{...}}}. Keys are cut to
// their first eight characters.
std::string ConnectionStatusJson(const std::map<std::string, vtob::core::broker::ConnectionStatus>& status,
                                 bool any_connected);

// {"success":..,"step":..,"message":..,"recorded":..,"pushes":[...]}
std::string DoorCommandJson(const vtob::core::control::DoorCommandOutcome& outcome);

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace vtob
