#include <map>
#include <string>

#include <gtest/gtest.h>

#include "services/web_services/api/rest_api.hpp"

namespace api = vtob::services::web_services::api;
namespace broker = vtob::core::broker;

TEST(ConnectionStatusJson, ShortensKeysAndReportsPhase) {
  std::map<std::string, broker::ConnectionStatus> status;
  broker::ConnectionStatus s;
  s.key = "0123456789abcdef";
  s.phase = broker::Phase::Reconnecting;
  s.reconnect_attempts = 3;
  s.current_interval_ms = 5070;
  s.subscribed_topics = 0;
  status.emplace(s.key, s);

  const std::string json = api::ConnectionStatusJson(status, false);

  EXPECT_EQ(json.find("0123456789abcdef"), std::string::npos);
  EXPECT_NE(json.find("\"01234567\":{"), std::string::npos);
  EXPECT_NE(json.find("\"connected\":false"), std::string::npos);
  EXPECT_NE(json.find("\"phase\":\"reconnecting\""), std::string::npos);
  EXPECT_NE(json.find("\"reconnect_attempts\":3"), std::string::npos);
  EXPECT_NE(json.find("\"current_interval_ms\":5070"), std::string::npos);
  EXPECT_NE(json.find("\"last_connect\":null"), std::string::npos);
}

TEST(DoorCommandJson, IncludesPerAccountPushes) {
  vtob::core::control::DoorCommandOutcome out;
  out.actuation.success = true;
  out.actuation.message = "door opened";
  out.recorded = true;
  vtob::core::cloud::AccountPushOutcome p;
  p.account_name = "home";
  p.result.code = 0;
  p.result.message = "OK";
  out.pushes.push_back(p);

  const std::string json = api::DoorCommandJson(out);

  EXPECT_NE(json.find("\"success\":true"), std::string::npos);
  EXPECT_NE(json.find("\"recorded\":true"), std::string::npos);
  EXPECT_NE(json.find("\"pushes\":[{\"account\":\"home\",\"code\":0"), std::string::npos);
}

TEST(ConnectionStatusJson, SharedKeyPrefixesStayDistinct) {
  std::map<std::string, broker::ConnectionStatus> status;
  for (const char* key : {"abcdefgh0001", "abcdefgh0002", "zzzzzzzz"}) {
    broker::ConnectionStatus s;
    s.key = key;
    status.emplace(key, s);
  }

  const std::string json = api::ConnectionStatusJson(status, false);

  EXPECT_NE(json.find("\"abcdefgh\":{"), std::string::npos);
  EXPECT_NE(json.find("\"abcdefgh#2\":{"), std::string::npos);
  EXPECT_NE(json.find("\"zzzzzzzz\":{"), std::string::npos);
  EXPECT_EQ(json.find("0001"), std::string::npos);
}
