#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "core/common/http/http_client.hpp"
#include "core/common/logger/logger.hpp"

namespace vtob::core::device::protocol_adapters::vto {

// Step names reported in ActuationResult::step.
inline constexpr const char* kStepLogin = "login";
inline constexpr const char* kStepAcquireHandle = "acquire_handle";
inline constexpr const char* kStepOpenDoor = "open_door";
inline constexpr const char* kStepReleaseHandle = "release_handle";
inline constexpr const char* kStepLogout = "logout";

class ProtocolError : public std::runtime_error {
public:
  ProtocolError(std::string step, const std::string& what)
      : std::runtime_error(what), step_(std::move(step)) {}

  const std::string& Step() const { return step_; }

private:
  std::string step_;
};

struct ActuationDiagnostics {
  std::string session;      // raw JSON token returned by global.login
  std::string door_handle;  // raw JSON token returned by factory.instance
  bool open_result = false;
  bool release_result = false;
  bool logout_result = false;
  int last_http_status = 0;
  std::int64_t last_request_id = 0;
};

struct ActuationResult {
  bool success = false;
  std::string step;  // failing step, empty on success
  std::string message;
  ActuationDiagnostics diagnostics;
};

// JSON-RPC over HTTP client for one door station: login with the
// realm/random challenge, then factory.instance -> openDoor -> destroy ->
// logout. Only the request id counter survives between calls.
class ActuationClient {
public:
  struct Options {
    std::string host;
    std::uint16_t port = 80;
    std::string username = "admin";
    std::string password = "admin123";
    int timeout_ms = 10000;
  };

  ActuationClient(Options opt, std::shared_ptr<common::http::HttpClient> http,
                  std::shared_ptr<common::log::Logger> logger);

  ActuationResult ExecuteOpenFlow(int door_index, const std::string& short_number);

  std::int64_t LastRequestId() const { return request_id_; }

private:
  struct RpcSession {
    std::string token = "0";
  };

  struct LoginOutcome {
    bool ok = false;
    std::string message;
  };

  std::int64_t NextId() { return ++request_id_; }

  LoginOutcome Login(RpcSession& session, ActuationDiagnostics& diag);
  std::string AcquireDoorHandle(const RpcSession& session, ActuationDiagnostics& diag);
  bool OpenDoor(const RpcSession& session, const std::string& handle, int door_index,
                const std::string& short_number, ActuationDiagnostics& diag);
  bool ReleaseDoorHandle(const RpcSession& session, const std::string& handle,
                         ActuationDiagnostics& diag);
  bool Logout(const RpcSession& session, ActuationDiagnostics& diag);
  void LogoutQuietly(const RpcSession& session, ActuationDiagnostics& diag);

  // Posts body and returns the response body. Throws ProtocolError on
  // transport failure, non-200 status, or a body that is not a JSON object.
  std::string Call(const char* step, const std::string& url, const std::string& body,
                   ActuationDiagnostics& diag);

  std::string Describe() const;

private:
  Options opt_;
  std::string login_url_;
  std::string rpc_url_;
  std::shared_ptr<common::http::HttpClient> http_;
  std::shared_ptr<common::log::Logger> logger_;
  std::int64_t request_id_ = 1000;
};

}  // namespace vtob::core::device::protocol_adapters::vto
