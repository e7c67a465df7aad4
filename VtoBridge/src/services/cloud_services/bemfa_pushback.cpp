#include "services/cloud_services/bemfa_pushback.hpp"

#include <utility>
#include <vector>

#include "mongoose.h"

#include "core/common/utils/json_utils.hpp"

namespace vtob::services::cloud_services {

namespace json = vtob::core::common::json;
using vtob::core::cloud::PushResult;

namespace {

constexpr int kMqttTopicType = 1;

}  // namespace

BemfaPushback::BemfaPushback(Options opt, std::shared_ptr<vtob::core::common::http::HttpClient> http,
                             std::shared_ptr<vtob::core::common::log::Logger> logger)
    : opt_(std::move(opt)), http_(std::move(http)), log_(std::move(logger), "pushback") {}

std::string BemfaPushback::BuildBody(const std::string& account_key, const std::string& topic,
                                     const std::string& status, const std::string& human_message) {
  std::vector<std::pair<std::string, std::string>> fields = {
      {"uid", json::Quote(account_key)},
      {"topic", json::Quote(topic)},
      {"type", json::Number(kMqttTopicType)},
      {"msg", json::Quote(status)},
  };
  if (!human_message.empty()) fields.emplace_back("wemsg", json::Quote(human_message));
  return json::Object(fields);
}

PushResult BemfaPushback::ParseReply(const std::string& body) {
  PushResult r;
  const struct mg_str s = mg_str_n(body.data(), body.size());

  double code = 0;
  if (body.empty() || !mg_json_get_num(s, "$.code", &code)) {
    r.code = -1;
    r.message = "unreadable reply: " + body;
    return r;
  }
  r.code = static_cast<int>(code);

  char* msg = mg_json_get_str(s, "$.message");
  if (msg != nullptr) {
    r.message = msg;
    mg_free(msg);
  }
  return r;
}

PushResult BemfaPushback::SendStatus(const std::string& account_key, const std::string& topic,
                                     const std::string& status, const std::string& human_message) {
  PushResult r;
  if (!http_) {
    r.message = "no http transport";
    return r;
  }

  const std::string body = BuildBody(account_key, topic, status, human_message);
  const auto resp = http_->Post(opt_.url, body, "application/json; charset=utf-8", opt_.timeout_ms);
  if (!resp.ok) {
    r.message = resp.error.empty() ? std::string("request failed") : resp.error;
    log_.Warn("push for " + topic + " failed: " + r.message);
    return r;
  }
  if (resp.status != 200) {
    r.message = "http status " + std::to_string(resp.status);
    log_.Warn("push for " + topic + " failed: " + r.message);
    return r;
  }

  r = ParseReply(resp.body);
  log_.Debug("push for " + topic + " -> code " + std::to_string(r.code));
  return r;
}

}  // namespace vtob::services::cloud_services
