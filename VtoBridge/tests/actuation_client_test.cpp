#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "core/device/protocol_adapters/vto_adapter/actuation_client.hpp"
#include "core/device/protocol_adapters/vto_adapter/vto_digest.hpp"
#include "fakes.hpp"

namespace vto = vtob::core::device::protocol_adapters::vto;
using vtob::test_support::FakeHttpClient;
using vtob::test_support::Reply;
using vtob::test_support::TransportFailure;

namespace {

const char kChallenge[] =
    R"({"error":{"code":268632079,"message":"Component error: login challenge!"},"id":1001,)"
    R"("params":{"encryption":"Default","random":"12345","realm":"generic"},"result":false,"session":"S7"})";
const char kLoginOk[] = R"({"id":1002,"params":{"keepAliveInterval":60},"result":true,"session":"S7"})";
const char kHandle[] = R"({"id":1003,"result":3040,"session":"S7"})";
const char kTrue[] = R"({"result":true,"session":"S7"})";
const char kFalse[] = R"({"result":false,"session":"S7"})";

class ActuationClientTest : public ::testing::Test {
protected:
  void ScriptHappyPath() {
    http_->On("global.login", Reply(kChallenge));
    http_->On("global.login", Reply(kLoginOk));
    http_->On("accessControl.factory.instance", Reply(kHandle));
    http_->On("accessControl.openDoor", Reply(kTrue));
    http_->On("accessControl.destroy", Reply(kTrue));
    http_->On("global.logout", Reply(kTrue));
  }

  vto::ActuationClient MakeClient() {
    vto::ActuationClient::Options opt;
    opt.host = "172.16.11.1";
    opt.port = 80;
    opt.username = "admin";
    opt.password = "admin123";
    return vto::ActuationClient(opt, http_, nullptr);
  }

  std::shared_ptr<FakeHttpClient> http_ = std::make_shared<FakeHttpClient>();
};

}  // namespace

TEST_F(ActuationClientTest, OpensDoorThroughFullSequence) {
  ScriptHappyPath();
  auto client = MakeClient();

  const auto r = client.ExecuteOpenFlow(0, "04001010001");

  EXPECT_TRUE(r.success) << r.message;
  EXPECT_TRUE(r.step.empty());
  EXPECT_EQ(r.diagnostics.door_handle, "3040");
  EXPECT_TRUE(r.diagnostics.release_result);
  EXPECT_TRUE(r.diagnostics.logout_result);

  const std::vector<std::string> expected = {"global.login", "global.login",
                                             "accessControl.factory.instance",
                                             "accessControl.openDoor", "accessControl.destroy",
                                             "global.logout"};
  EXPECT_EQ(http_->Methods(), expected);
}

TEST_F(ActuationClientTest, LoginGoesToLoginPathAndRestToRpc) {
  ScriptHappyPath();
  auto client = MakeClient();
  (void)client.ExecuteOpenFlow(0, "04001010001");

  const auto reqs = http_->Requests();
  ASSERT_EQ(reqs.size(), 6u);
  EXPECT_EQ(reqs[0].url, "http://172.16.11.1:80/RPC2_Login");
  EXPECT_EQ(reqs[1].url, "http://172.16.11.1:80/RPC2_Login");
  for (size_t i = 2; i < reqs.size(); ++i) EXPECT_EQ(reqs[i].url, "http://172.16.11.1:80/RPC2");
}

TEST_F(ActuationClientTest, SecondLoginCarriesDigestAndChallenge) {
  ScriptHappyPath();
  auto client = MakeClient();
  (void)client.ExecuteOpenFlow(0, "04001010001");

  const auto reqs = http_->Requests();
  ASSERT_GE(reqs.size(), 2u);
  const std::string& second = reqs[1].body;
  EXPECT_NE(second.find("\"password\":\"" + vto::LoginDigest("admin", "generic", "12345", "admin123") + "\""),
            std::string::npos);
  EXPECT_NE(second.find("\"realm\":\"generic\""), std::string::npos);
  EXPECT_NE(second.find("\"random\":\"12345\""), std::string::npos);
  EXPECT_NE(second.find("\"session\":\"S7\""), std::string::npos);
  EXPECT_NE(reqs[0].body.find("\"session\":0"), std::string::npos);
}

TEST_F(ActuationClientTest, OpenDoorSendsHandleAndShortNumber) {
  ScriptHappyPath();
  auto client = MakeClient();
  (void)client.ExecuteOpenFlow(1, "04001010001");

  for (const auto& req : http_->Requests()) {
    if (req.method != "accessControl.openDoor") continue;
    EXPECT_NE(req.body.find("\"object\":3040"), std::string::npos);
    EXPECT_NE(req.body.find("\"DoorIndex\":1"), std::string::npos);
    EXPECT_NE(req.body.find("\"ShortNumber\":\"04001010001\""), std::string::npos);
    EXPECT_NE(req.body.find("\"Type\":\"Remote\""), std::string::npos);
    return;
  }
  FAIL() << "openDoor was never sent";
}

TEST_F(ActuationClientTest, RequestIdsStartAfterThousandAndIncrease) {
  ScriptHappyPath();
  auto client = MakeClient();
  (void)client.ExecuteOpenFlow(0, "04001010001");

  const auto reqs = http_->Requests();
  ASSERT_FALSE(reqs.empty());
  EXPECT_EQ(reqs.front().id, 1001);
  for (size_t i = 1; i < reqs.size(); ++i) EXPECT_EQ(reqs[i].id, reqs[i - 1].id + 1);
  EXPECT_EQ(client.LastRequestId(), reqs.back().id);
}

TEST_F(ActuationClientTest, HandleFailureStillLogsOut) {
  http_->On("global.login", Reply(kChallenge));
  http_->On("global.login", Reply(kLoginOk));
  http_->On("accessControl.factory.instance",
            Reply(R"({"error":{"code":268959743,"message":"Unknown error"},"result":false,"session":"S7"})"));
  http_->On("global.logout", Reply(kTrue));
  auto client = MakeClient();

  const auto r = client.ExecuteOpenFlow(0, "04001010001");

  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.step, vto::kStepAcquireHandle);
  const auto methods = http_->Methods();
  ASSERT_FALSE(methods.empty());
  EXPECT_EQ(methods.back(), "global.logout");
  EXPECT_EQ(std::count(methods.begin(), methods.end(), "accessControl.openDoor"), 0);
}

TEST_F(ActuationClientTest, HandleHttpErrorStillLogsOut) {
  http_->On("global.login", Reply(kChallenge));
  http_->On("global.login", Reply(kLoginOk));
  http_->On("accessControl.factory.instance", Reply("", 500));
  http_->On("global.logout", Reply(kTrue));
  auto client = MakeClient();

  const auto r = client.ExecuteOpenFlow(0, "04001010001");

  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.step, vto::kStepAcquireHandle);
  EXPECT_EQ(http_->Methods().back(), "global.logout");
}

TEST_F(ActuationClientTest, RejectedOpenReportsOpenStep) {
  http_->On("global.login", Reply(kChallenge));
  http_->On("global.login", Reply(kLoginOk));
  http_->On("accessControl.factory.instance", Reply(kHandle));
  http_->On("accessControl.openDoor", Reply(kFalse));
  http_->On("accessControl.destroy", Reply(kTrue));
  http_->On("global.logout", Reply(kTrue));
  auto client = MakeClient();

  const auto r = client.ExecuteOpenFlow(0, "04001010001");

  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.step, vto::kStepOpenDoor);
  EXPECT_EQ(http_->Methods().back(), "global.logout");
}

TEST_F(ActuationClientTest, RejectedCredentialsStopAtLogin) {
  http_->On("global.login", Reply(kChallenge));
  http_->On("global.login",
            Reply(R"({"error":{"code":268632085,"message":"Password not valid"},"result":false,"session":"S7"})"));
  auto client = MakeClient();

  const auto r = client.ExecuteOpenFlow(0, "04001010001");

  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.step, vto::kStepLogin);
  EXPECT_NE(r.message.find("Password not valid"), std::string::npos);
  EXPECT_EQ(http_->Requests().size(), 2u);
}

TEST_F(ActuationClientTest, UnreachableDeviceFailsAtLogin) {
  http_->OnAnything(TransportFailure("connection refused"));
  auto client = MakeClient();

  const auto r = client.ExecuteOpenFlow(0, "04001010001");

  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.step, vto::kStepLogin);
  EXPECT_NE(r.message.find("connection refused"), std::string::npos);
  EXPECT_EQ(http_->Requests().size(), 1u);
}

TEST_F(ActuationClientTest, MalformedChallengeFailsAtLogin) {
  http_->On("global.login", Reply("not json"));
  auto client = MakeClient();

  const auto r = client.ExecuteOpenFlow(0, "04001010001");

  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.step, vto::kStepLogin);
}

TEST_F(ActuationClientTest, LogoutFailureDoesNotMaskSuccess) {
  http_->On("global.login", Reply(kChallenge));
  http_->On("global.login", Reply(kLoginOk));
  http_->On("accessControl.factory.instance", Reply(kHandle));
  http_->On("accessControl.openDoor", Reply(kTrue));
  http_->On("accessControl.destroy", Reply(kTrue));
  http_->On("global.logout", TransportFailure("timeout"));
  auto client = MakeClient();

  const auto r = client.ExecuteOpenFlow(0, "04001010001");

  EXPECT_TRUE(r.success);
  EXPECT_FALSE(r.diagnostics.logout_result);
}
