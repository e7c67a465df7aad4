#include "services/web_services/api/rest_api.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/time_utils.hpp"

namespace vtob {
namespace services {
namespace web_services {
namespace api {

namespace json = vtob::core::common::json;
using vtob::core::broker::ConnectionStatus;

namespace {

static bool IsMethod(const struct mg_http_message* hm, const char* method) {
  return mg_strcmp(hm->method, mg_str(method)) == 0;
}

static std::string Timestamp(std::int64_t unix_ms) {
  if (unix_ms <= 0) return "null";
  return json::Quote(vtob::core::common::time::ToIso8601Utc(unix_ms));
}

static std::string StatusToJson(const ConnectionStatus& s) {
  return json::Object({
      {"phase", json::Quote(vtob::core::broker::ToString(s.phase))},
      {"connected", json::Bool(s.connected)},
      {"reconnect_attempts", json::Number(s.reconnect_attempts)},
      {"current_interval_ms", json::Number(s.current_interval_ms)},
      {"last_connect", Timestamp(s.last_connect_ms)},
      {"last_disconnect", Timestamp(s.last_disconnect_ms)},
      {"last_heartbeat", Timestamp(s.last_heartbeat_ms)},
      {"subscribed_topics", json::Number(static_cast<std::int64_t>(s.subscribed_topics))},
      {"reconnect_active", json::Bool(s.reconnect_active)},
  });
}

static std::string TopicFromBody(const struct mg_http_message* hm) {
  std::string topic;
  char* t = mg_json_get_str(hm->body, "$.topic");
  if (t != nullptr) {
    topic = t;
    mg_free(t);
  }
  return topic;
}

}  // namespace

std::string ConnectionStatusJson(const std::map<std::string, ConnectionStatus>& status, bool any_connected) {
  std::vector<std::pair<std::string, std::string>> per_key;
  per_key.reserve(status.size());
  // Keys are shown by their first 8 characters; a shared prefix gets a
  // "#n" suffix in key order so no tenant is hidden.
  std::map<std::string, int> seen;
  for (const auto& kv : status) {
    std::string label = kv.first.substr(0, 8);
    const int n = ++seen[label];
    if (n > 1) label += "#" + std::to_string(n);
    per_key.emplace_back(std::move(label), StatusToJson(kv.second));
  }
  return json::Object({
      {"connected", json::Bool(any_connected)},
      {"connections", json::Object(per_key)},
  });
}

bool HandleConnectionApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                         const ApiContext& ctx) {
  if (rel_path.compare(0, 6, "/mqtt/") != 0) return false;
  if (ctx.supervisor == nullptr) {
    mg_http_reply(c, 500, "Content-Type: application/json\r\n", "{\"error\":\"supervisor_null\"}\n");
    return true;
  }

  if (IsMethod(hm, "GET") && rel_path == "/mqtt/status") {
    const std::string body = ConnectionStatusJson(ctx.supervisor->GetStatus(), ctx.supervisor->IsConnected());
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    return true;
  }

  if (IsMethod(hm, "POST") && rel_path == "/mqtt/reconcile") {
    const auto report = ctx.supervisor->Reconcile();
    const std::string body = json::Object({
        {"started", json::Number(static_cast<std::int64_t>(report.started.size()))},
        {"stopped", json::Number(static_cast<std::int64_t>(report.stopped.size()))},
        {"kept", json::Number(static_cast<std::int64_t>(report.kept.size()))},
    });
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    return true;
  }

  const bool subscribe = rel_path == "/mqtt/subscribe";
  if (IsMethod(hm, "POST") && (subscribe || rel_path == "/mqtt/unsubscribe")) {
    const std::string topic = TopicFromBody(hm);
    if (topic.empty()) {
      mg_http_reply(c, 400, "Content-Type: application/json\r\n", "{\"error\":\"missing_topic\"}\n");
      return true;
    }

    const std::size_t issued =
        subscribe ? ctx.supervisor->SubscribeTopic(topic) : ctx.supervisor->UnsubscribeTopic(topic);
    const std::string body = json::Object({
        {"ok", json::Bool(issued > 0)},
        {"connections", json::Number(static_cast<std::int64_t>(issued))},
    });
    mg_http_reply(c, 200, "Content-Type: application/json\r\n", "%s\n", body.c_str());
    return true;
  }

  return false;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace vtob
