#include "services/web_services/api/rest_api.hpp"

#include <string>
#include <vector>

#include "core/common/utils/json_utils.hpp"

namespace vtob {
namespace services {
namespace web_services {
namespace api {

namespace json = vtob::core::common::json;

namespace {

static bool IsMethod(const struct mg_http_message* hm, const char* method) {
  return mg_strcmp(hm->method, mg_str(method)) == 0;
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string DoorCommandJson(const vtob::core::control::DoorCommandOutcome& outcome) {
  std::vector<std::string> pushes;
  pushes.reserve(outcome.pushes.size());
  for (const auto& p : outcome.pushes) {
    pushes.push_back(json::Object({
        {"account", json::Quote(p.account_name)},
        {"code", json::Number(p.result.code)},
        {"message", json::Quote(p.result.message)},
    }));
  }
  return json::Object({
      {"success", json::Bool(outcome.actuation.success)},
      {"step", json::Quote(outcome.actuation.step)},
      {"message", json::Quote(outcome.actuation.message)},
      {"recorded", json::Bool(outcome.recorded)},
      {"pushes", json::Array(pushes)},
  });
}

bool HandleDeviceApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx) {
  if (c == nullptr || hm == nullptr) return false;
  if (rel_path != "/devices" && !StartsWith(rel_path, "/devices/")) return false;
  if (ctx.device_registry == nullptr) {
    mg_http_reply(c, 500, "Content-Type: application/json\r\n", "{\"error\":\"device_registry_null\"}\n");
    return true;
  }

  if (IsMethod(hm, "GET") && rel_path == "/devices") {
    const std::string body = ctx.device_registry->ToJsonList();
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    return true;
  }

  const std::string base = "/devices/";
  const std::string tail = "/open";
  if (IsMethod(hm, "POST") && EndsWith(rel_path, tail) && rel_path.size() > base.size() + tail.size()) {
    const std::string id = rel_path.substr(base.size(), rel_path.size() - base.size() - tail.size());

    vtob::core::device::model::DeviceEntity device;
    if (!ctx.device_registry->Get(id, device)) {
      mg_http_reply(c, 404, "Content-Type: application/json\r\n", "{\"error\":\"device_not_found\"}\n");
      return true;
    }
    if (ctx.commands == nullptr) {
      mg_http_reply(c, 500, "Content-Type: application/json\r\n", "{\"error\":\"command_handler_null\"}\n");
      return true;
    }

    const vtob::core::common::log::TaggedLogger log(ctx.logger, "api");
    const auto outcome = ctx.commands->Execute(device, log);
    const std::string body = DoorCommandJson(outcome);
    mg_http_reply(c, outcome.actuation.success ? 200 : 502, "Content-Type: application/json\r\n", "%s\n",
                  body.c_str());
    return true;
  }

  if (IsMethod(hm, "GET")) {
    const std::string id = rel_path.substr(base.size());
    std::string body;
    if (!id.empty() && ctx.device_registry->ToJsonOne(id, body)) {
      mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    } else {
      mg_http_reply(c, 404, "Content-Type: application/json\r\n", "{\"error\":\"device_not_found\"}\n");
    }
    return true;
  }

  return false;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace vtob
