#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "core/broker/tenant_connection.hpp"
#include "core/control/door_command.hpp"
#include "core/device/model/topic.hpp"
#include "fakes.hpp"

namespace broker = vtob::core::broker;
namespace control = vtob::core::control;
using vtob::core::device::model::DeviceEntity;
using vtob::test_support::Account;
using vtob::test_support::FakeAccountDirectory;
using vtob::test_support::FakeBroker;
using vtob::test_support::FakeDeviceDirectory;
using vtob::test_support::FakePushback;
using vtob::test_support::FakeTransportFactory;
using vtob::test_support::WaitUntil;

namespace {

DeviceEntity Device(const std::string& id, const std::string& address, bool visible = true) {
  DeviceEntity d;
  d.id = id;
  d.name = id;
  d.address = address;
  d.topic = vtob::core::device::model::DeriveTopic(address);
  d.visible = visible;
  return d;
}

class TenantConnectionTest : public ::testing::Test {
protected:
  void SetUp() override {
    devices_->Add(Device("front", "172.16.11.1"));
    devices_->Add(Device("garage", "172.16.11.2"));
    devices_->Add(Device("hidden", "172.16.11.3", false));
    accounts_->Set({Account("home", "key-home"), Account("office", "key-office")});

    opt_.heartbeat_interval_ms = 40;
    opt_.heartbeat_timeout_ms = 40;
    opt_.health_check_interval_ms = 60000;  // driven by hand
    opt_.reconnect_base_ms = 20;
    opt_.reconnect_max_ms = 400;
    opt_.connect_wait_ms = 300;
    opt_.join_timeout_ms = 2000;
    opt_.io_poll_ms = 5;
  }

  void TearDown() override {
    if (conn_) conn_->Stop();
  }

  std::shared_ptr<broker::TenantConnection> Make() {
    commands_ = std::make_shared<control::DoorCommandHandler>(
        devices_, accounts_, pushback_, [this](const DeviceEntity& d) {
          last_actuated_ = d.id;
          ++actuations_;
          control::ActuationResult r;
          r.success = true;
          return r;
        });

    broker::TenantConnection::Dependencies deps;
    deps.devices = devices_;
    deps.commands = commands_;
    deps.transport_factory = FakeTransportFactory(broker_);
    deps.probe = [this](const std::string&, std::uint16_t, int) { return reachable_.load(); };
    conn_ = std::make_shared<broker::TenantConnection>("key-home", opt_, deps);
    return conn_;
  }

  broker::ConnectionOptions opt_;
  std::shared_ptr<FakeBroker> broker_ = std::make_shared<FakeBroker>();
  std::shared_ptr<FakeDeviceDirectory> devices_ = std::make_shared<FakeDeviceDirectory>();
  std::shared_ptr<FakeAccountDirectory> accounts_ = std::make_shared<FakeAccountDirectory>();
  std::shared_ptr<FakePushback> pushback_ = std::make_shared<FakePushback>();
  std::shared_ptr<control::DoorCommandHandler> commands_;
  std::shared_ptr<broker::TenantConnection> conn_;

  std::atomic<bool> reachable_{true};
  std::atomic<int> actuations_{0};
  std::string last_actuated_;
};

}  // namespace

TEST_F(TenantConnectionTest, ConnectsAndSubscribesVisibleDevices) {
  auto conn = Make();
  EXPECT_EQ(conn->CurrentPhase(), broker::Phase::Idle);
  ASSERT_TRUE(conn->Start());

  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }));
  ASSERT_TRUE(WaitUntil([&] { return broker_->Subscribed().size() == 2; }));

  const auto subs = broker_->Subscribed();
  EXPECT_EQ(subs.count("vto172161101006"), 1u);
  EXPECT_EQ(subs.count("vto172161102006"), 1u);
  EXPECT_EQ(conn->Status().subscribed_topics, 2u);
  EXPECT_GT(conn->Status().last_connect_ms, 0);
}

TEST_F(TenantConnectionTest, StartTwiceIsRejected) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  EXPECT_FALSE(conn->Start());
}

TEST_F(TenantConnectionTest, StopIsTerminal) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }));

  const auto begin = std::chrono::steady_clock::now();
  conn->Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(3));

  EXPECT_EQ(conn->CurrentPhase(), broker::Phase::Stopped);
  EXPECT_FALSE(conn->IsConnected());
  EXPECT_FALSE(conn->Start());
  EXPECT_FALSE(conn->Subscribe("vto999"));
  conn->Stop();
}

TEST_F(TenantConnectionTest, OpenMessageActuatesRecordsAndNotifies) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }));

  broker_->Publish("vto172161101006", "open");

  ASSERT_TRUE(WaitUntil([&] { return pushback_->Calls().size() == 2; }));
  EXPECT_EQ(actuations_.load(), 1);
  EXPECT_EQ(devices_->Recorded().size(), 1u);
  EXPECT_EQ(devices_->Recorded()[0].first, "front");
}

TEST_F(TenantConnectionTest, UnknownTopicIsDroppedWithoutActuation) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }));

  broker_->Publish("vto999999999006", "open");
  broker_->Publish("vto172161101006", "off");
  // A later message on the same I/O thread proves the earlier ones were handled.
  broker_->Publish("vto172161102006", "on");

  ASSERT_TRUE(WaitUntil([&] { return actuations_.load() == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(actuations_.load(), 1);
  EXPECT_EQ(last_actuated_, "garage");
  EXPECT_TRUE(conn->IsConnected());
}

TEST_F(TenantConnectionTest, StaleHeartbeatSchedulesExactlyOneReconnect) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }));

  // Pings go unanswered and the broker stays unreachable, so the worker
  // keeps waiting instead of finishing.
  broker_->SetAnswerPings(false);
  reachable_.store(false);
  std::this_thread::sleep_for(std::chrono::milliseconds(150));

  EXPECT_FALSE(conn->RunHealthCheck());
  EXPECT_EQ(conn->CurrentPhase(), broker::Phase::Reconnecting);

  for (int i = 0; i < 5; ++i) (void)conn->RunHealthCheck();

  const auto s = conn->Status();
  EXPECT_TRUE(s.reconnect_active);
  EXPECT_EQ(s.reconnects_scheduled, 1);
  EXPECT_EQ(conn->CurrentPhase(), broker::Phase::Reconnecting);
}

TEST_F(TenantConnectionTest, StalledFirstConnectIsRetried) {
  broker_->SetAnswerConnects(false);
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return broker_->Connects() == 1; }));

  EXPECT_TRUE(conn->RunHealthCheck());
  std::this_thread::sleep_for(std::chrono::milliseconds(opt_.connect_wait_ms + 100));
  EXPECT_EQ(conn->CurrentPhase(), broker::Phase::Connecting);

  EXPECT_FALSE(conn->RunHealthCheck());
  EXPECT_EQ(conn->Status().reconnects_scheduled, 1);

  broker_->SetAnswerConnects(true);
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }, 5000));
  EXPECT_GE(broker_->Connects(), 2);
  EXPECT_EQ(conn->Status().reconnects_scheduled, 1);
}

TEST_F(TenantConnectionTest, HealthyConnectionPassesHealthCheck) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }));

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  EXPECT_TRUE(conn->RunHealthCheck());
  EXPECT_GT(broker_->Pings(), 0);
  EXPECT_EQ(conn->Status().reconnects_scheduled, 0);
}

TEST_F(TenantConnectionTest, BackoffGrowsWhileFailingAndResetsOnConnect) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }));

  broker_->SetAccept(false);
  broker_->Drop();

  ASSERT_TRUE(WaitUntil([&] { return conn->Status().reconnect_attempts >= 3; }, 5000));
  EXPECT_FALSE(conn->IsConnected());
  EXPECT_GT(conn->Status().current_interval_ms, opt_.reconnect_base_ms);

  broker_->SetAccept(true);
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }, 5000));

  const auto s = conn->Status();
  EXPECT_EQ(s.current_interval_ms, opt_.reconnect_base_ms);
  EXPECT_EQ(s.reconnect_attempts, 0);
  EXPECT_EQ(s.reconnects_scheduled, 1);
  EXPECT_GT(s.last_disconnect_ms, 0);
}

TEST_F(TenantConnectionTest, ResubscribesAfterReconnect) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return broker_->Subscribed().size() == 2; }));
  const int connects = broker_->Connects();

  broker_->Drop();

  ASSERT_TRUE(WaitUntil([&] { return broker_->Connects() > connects && conn->IsConnected(); }));
  ASSERT_TRUE(WaitUntil([&] { return conn->Status().subscribed_topics == 2; }));
}

TEST_F(TenantConnectionTest, UnreachableBrokerSkipsAttempts) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }));
  const int connects = broker_->Connects();

  reachable_.store(false);
  broker_->Drop();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  EXPECT_EQ(broker_->Connects(), connects);
  EXPECT_EQ(conn->Status().reconnect_attempts, 0);
  EXPECT_EQ(conn->CurrentPhase(), broker::Phase::Reconnecting);
}

TEST_F(TenantConnectionTest, GivesUpAfterMaxAttempts) {
  opt_.max_reconnect_attempts = 2;
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->IsConnected(); }));

  broker_->SetAccept(false);
  broker_->Drop();

  ASSERT_TRUE(WaitUntil([&] { return !conn->Status().reconnect_active && conn->Status().reconnect_attempts == 2; }, 5000));
  EXPECT_EQ(conn->CurrentPhase(), broker::Phase::Disconnected);
}

TEST_F(TenantConnectionTest, SubscribeAndUnsubscribeWhileConnected) {
  auto conn = Make();
  EXPECT_FALSE(conn->Subscribe("vto100"));
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->Status().subscribed_topics == 2; }));

  EXPECT_TRUE(conn->Subscribe("vto100"));
  EXPECT_FALSE(conn->Subscribe("vto100"));
  ASSERT_TRUE(WaitUntil([&] { return broker_->Subscribed().count("vto100") == 1; }));

  EXPECT_TRUE(conn->Unsubscribe("vto100"));
  EXPECT_FALSE(conn->Unsubscribe("vto100"));
  ASSERT_TRUE(WaitUntil([&] { return broker_->Subscribed().count("vto100") == 0; }));
}

TEST_F(TenantConnectionTest, UnsubscribeUpdatesCountBeforeBrokerCall) {
  auto conn = Make();
  ASSERT_TRUE(conn->Start());
  ASSERT_TRUE(WaitUntil([&] { return conn->Status().subscribed_topics == 2; }));

  EXPECT_TRUE(conn->Unsubscribe("vto172161101006"));
  EXPECT_EQ(conn->Status().subscribed_topics, 1u);
  ASSERT_TRUE(WaitUntil([&] { return broker_->Subscribed().count("vto172161101006") == 0; }));
}

namespace {

broker::HealthSnapshot Snapshot(broker::Phase phase) {
  broker::HealthSnapshot s;
  s.phase = phase;
  s.transport_connected = phase == broker::Phase::Connected;
  s.auto_reconnect = true;
  return s;
}

}  // namespace

TEST(HealthProblem, ConnectedNeedsRecentHeartbeatAndLiveTransport) {
  broker::ConnectionOptions opt;
  auto s = Snapshot(broker::Phase::Connected);
  s.heartbeat_silence_ms = opt.heartbeat_interval_ms;
  EXPECT_EQ(broker::HealthProblem(s, opt), "");

  s.heartbeat_silence_ms = opt.heartbeat_interval_ms + opt.heartbeat_timeout_ms + 1;
  EXPECT_NE(broker::HealthProblem(s, opt).find("no heartbeat"), std::string::npos);

  s.heartbeat_silence_ms = 0;
  s.transport_connected = false;
  EXPECT_EQ(broker::HealthProblem(s, opt), "transport reports not connected");
}

TEST(HealthProblem, ConnectingIsFlaggedAfterConnectWait) {
  broker::ConnectionOptions opt;
  auto s = Snapshot(broker::Phase::Connecting);
  s.connect_elapsed_ms = opt.connect_wait_ms;
  EXPECT_EQ(broker::HealthProblem(s, opt), "");

  s.connect_elapsed_ms = opt.connect_wait_ms + 1;
  EXPECT_NE(broker::HealthProblem(s, opt).find("connect pending"), std::string::npos);
}

TEST(HealthProblem, DisconnectedWithoutWorkerIsFlagged) {
  broker::ConnectionOptions opt;
  auto s = Snapshot(broker::Phase::Disconnected);
  EXPECT_EQ(broker::HealthProblem(s, opt), "disconnected with no reconnect scheduled");

  s.reconnect_scheduled = true;
  EXPECT_EQ(broker::HealthProblem(s, opt), "");

  // Gave up: nothing left to recover.
  s.reconnect_scheduled = false;
  s.auto_reconnect = false;
  EXPECT_EQ(broker::HealthProblem(s, opt), "");
}

TEST(HealthProblem, ReconnectingAndStoppedAreLeftAlone) {
  broker::ConnectionOptions opt;
  EXPECT_EQ(broker::HealthProblem(Snapshot(broker::Phase::Reconnecting), opt), "");
  EXPECT_EQ(broker::HealthProblem(Snapshot(broker::Phase::Stopped), opt), "");
  EXPECT_EQ(broker::HealthProblem(Snapshot(broker::Phase::Idle), opt), "");
}
