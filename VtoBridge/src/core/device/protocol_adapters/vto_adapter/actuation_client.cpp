#include "core/device/protocol_adapters/vto_adapter/actuation_client.hpp"

#include <optional>
#include <utility>

#include "mongoose.h"

#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/network_utils.hpp"
#include "core/device/protocol_adapters/vto_adapter/vto_digest.hpp"

namespace vtob::core::device::protocol_adapters::vto {

namespace json = vtob::core::common::json;

namespace {

constexpr const char* kJsonContentType = "application/json";

struct mg_str View(const std::string& s) { return mg_str_n(s.data(), s.size()); }

// Raw JSON text of the value at path, quotes included for strings.
std::optional<std::string> JsonToken(const std::string& body, const char* path) {
  int len = 0;
  const int ofs = mg_json_get(View(body), path, &len);
  if (ofs < 0 || len <= 0) return std::nullopt;
  return body.substr(static_cast<size_t>(ofs), static_cast<size_t>(len));
}

std::optional<std::string> JsonString(const std::string& body, const char* path) {
  char* s = mg_json_get_str(View(body), path);
  if (s == nullptr) return std::nullopt;
  std::string out(s);
  mg_free(s);
  return out;
}

bool JsonTrue(const std::string& body, const char* path) {
  bool v = false;
  return mg_json_get_bool(View(body), path, &v) && v;
}

std::string ErrorMessage(const std::string& body) {
  return JsonString(body, "$.error.message").value_or("unknown error");
}

}  // namespace

ActuationClient::ActuationClient(Options opt, std::shared_ptr<common::http::HttpClient> http,
                                 std::shared_ptr<common::log::Logger> logger)
    : opt_(std::move(opt)), http_(std::move(http)), logger_(std::move(logger)) {
  const std::string base = "http://" + common::net::JoinHostPort(opt_.host, opt_.port);
  login_url_ = base + "/RPC2_Login";
  rpc_url_ = base + "/RPC2";
}

std::string ActuationClient::Describe() const {
  return "vto " + common::net::JoinHostPort(opt_.host, opt_.port);
}

std::string ActuationClient::Call(const char* step, const std::string& url,
                                  const std::string& body, ActuationDiagnostics& diag) {
  if (!http_) throw ProtocolError(step, "no http transport");

  const common::http::HttpResponse resp = http_->Post(url, body, kJsonContentType, opt_.timeout_ms);
  diag.last_request_id = request_id_;
  diag.last_http_status = resp.status;

  if (!resp.ok) {
    throw ProtocolError(step, std::string(step) + ": request failed: " + resp.error);
  }
  if (resp.status != 200) {
    throw ProtocolError(step, std::string(step) + ": http status " + std::to_string(resp.status));
  }

  int len = 0;
  if (resp.body.empty() || mg_json_get(View(resp.body), "$", &len) < 0 ||
      resp.body.find('{') == std::string::npos) {
    throw ProtocolError(step, std::string(step) + ": malformed response");
  }
  return resp.body;
}

ActuationClient::LoginOutcome ActuationClient::Login(RpcSession& session,
                                                     ActuationDiagnostics& diag) {
  LoginOutcome out;
  try {
    const std::string challenge_req = json::Object({
        {"method", json::Quote("global.login")},
        {"params", json::Object({
                       {"userName", json::Quote(opt_.username)},
                       {"password", json::Quote("")},
                       {"clientType", json::Quote("GUI")},
                   })},
        {"id", json::Number(NextId())},
        {"session", "0"},
    });
    const std::string challenge = Call(kStepLogin, login_url_, challenge_req, diag);
    if (const auto tok = JsonToken(challenge, "$.session")) session.token = *tok;

    if (JsonTrue(challenge, "$.result")) {
      out.ok = true;
      out.message = "session pre-authorized";
      diag.session = session.token;
      return out;
    }

    const auto realm = JsonString(challenge, "$.params.realm");
    const auto random = JsonString(challenge, "$.params.random");
    const auto encryption = JsonString(challenge, "$.params.encryption");
    if (!realm || !random || !encryption) {
      throw ProtocolError(kStepLogin, "login: challenge lacks realm, random or encryption");
    }

    const std::string login_req = json::Object({
        {"method", json::Quote("global.login")},
        {"params", json::Object({
                       {"userName", json::Quote(opt_.username)},
                       {"password", json::Quote(LoginDigest(opt_.username, *realm, *random,
                                                            opt_.password))},
                       {"clientType", json::Quote("GUI")},
                       {"realm", json::Quote(*realm)},
                       {"random", json::Quote(*random)},
                       {"passwordType", json::Quote("Default")},
                       {"authorityType", json::Quote(*encryption)},
                   })},
        {"id", json::Number(NextId())},
        {"session", session.token},
    });
    const std::string reply = Call(kStepLogin, login_url_, login_req, diag);
    if (const auto tok = JsonToken(reply, "$.session")) session.token = *tok;

    if (JsonTrue(reply, "$.result")) {
      out.ok = true;
      out.message = "logged in";
    } else {
      out.message = "credentials rejected: " + ErrorMessage(reply);
    }
  } catch (const ProtocolError& e) {
    out.ok = false;
    out.message = e.what();
  }
  diag.session = session.token;
  return out;
}

std::string ActuationClient::AcquireDoorHandle(const RpcSession& session,
                                               ActuationDiagnostics& diag) {
  const std::string req = json::Object({
      {"id", json::Number(NextId())},
      {"method", json::Quote("accessControl.factory.instance")},
      {"params", json::Object({{"channel", json::Number(0)}})},
      {"session", session.token},
  });
  const std::string reply = Call(kStepAcquireHandle, rpc_url_, req, diag);

  const auto handle = JsonToken(reply, "$.result");
  if (!handle || *handle == "false" || *handle == "null") {
    throw ProtocolError(kStepAcquireHandle,
                        std::string(kStepAcquireHandle) + ": no door handle: " + ErrorMessage(reply));
  }
  return *handle;
}

bool ActuationClient::OpenDoor(const RpcSession& session, const std::string& handle,
                               int door_index, const std::string& short_number,
                               ActuationDiagnostics& diag) {
  const std::string req = json::Object({
      {"id", json::Number(NextId())},
      {"method", json::Quote("accessControl.openDoor")},
      {"object", handle},
      {"params", json::Object({
                     {"DoorIndex", json::Number(door_index)},
                     {"ShortNumber", json::Quote(short_number)},
                     {"Type", json::Quote("Remote")},
                 })},
      {"session", session.token},
  });
  const std::string reply = Call(kStepOpenDoor, rpc_url_, req, diag);
  return JsonTrue(reply, "$.result");
}

bool ActuationClient::ReleaseDoorHandle(const RpcSession& session, const std::string& handle,
                                        ActuationDiagnostics& diag) {
  const std::string req = json::Object({
      {"id", json::Number(NextId())},
      {"method", json::Quote("accessControl.destroy")},
      {"object", handle},
      {"session", session.token},
  });
  const std::string reply = Call(kStepReleaseHandle, rpc_url_, req, diag);
  return JsonTrue(reply, "$.result");
}

bool ActuationClient::Logout(const RpcSession& session, ActuationDiagnostics& diag) {
  const std::string req = json::Object({
      {"id", json::Number(NextId())},
      {"method", json::Quote("global.logout")},
      {"session", session.token},
  });
  const std::string reply = Call(kStepLogout, rpc_url_, req, diag);
  return JsonTrue(reply, "$.result");
}

void ActuationClient::LogoutQuietly(const RpcSession& session, ActuationDiagnostics& diag) {
  try {
    diag.logout_result = Logout(session, diag);
  } catch (const ProtocolError& e) {
    diag.logout_result = false;
    if (logger_) logger_->Warn(Describe() + " logout failed: " + e.what());
  }
}

ActuationResult ActuationClient::ExecuteOpenFlow(int door_index, const std::string& short_number) {
  ActuationResult result;
  RpcSession session;

  const LoginOutcome login = Login(session, result.diagnostics);
  if (!login.ok) {
    result.step = kStepLogin;
    result.message = "login failed: " + login.message;
    if (logger_) logger_->Error(Describe() + " " + result.message);
    return result;
  }

  try {
    auto& diag = result.diagnostics;
    diag.door_handle = AcquireDoorHandle(session, diag);
    diag.open_result = OpenDoor(session, diag.door_handle, door_index, short_number, diag);
    diag.release_result = ReleaseDoorHandle(session, diag.door_handle, diag);
    LogoutQuietly(session, diag);

    result.success = diag.open_result;
    if (result.success) {
      result.message = "door opened";
      if (logger_) logger_->Info(Describe() + " door " + std::to_string(door_index) + " opened");
    } else {
      result.step = kStepOpenDoor;
      result.message = "door open rejected by device";
      if (logger_) logger_->Error(Describe() + " " + result.message);
    }
  } catch (const ProtocolError& e) {
    LogoutQuietly(session, result.diagnostics);
    result.success = false;
    result.step = e.Step();
    result.message = e.what();
    if (logger_) logger_->Error(Describe() + " open flow aborted at " + e.Step() + ": " + e.what());
  }
  return result;
}

}  // namespace vtob::core::device::protocol_adapters::vto
