#include "core/broker/tenant_connection.hpp"

#include <utility>
#include <vector>

#include "core/common/utils/network_utils.hpp"
#include "core/common/utils/time_utils.hpp"

namespace vtob::core::broker {

namespace mqtt = vtob::core::device::protocol_adapters::mqtt;
namespace timeu = vtob::core::common::time;

const char* ToString(Phase phase) {
  switch (phase) {
    case Phase::Idle:         return "idle";
    case Phase::Connecting:   return "connecting";
    case Phase::Connected:    return "connected";
    case Phase::Reconnecting: return "reconnecting";
    case Phase::Disconnected: return "disconnected";
    case Phase::Stopped:      return "stopped";
    default:                  return "unknown";
  }
}

namespace {

// Keys are account secrets; logs only carry a prefix.
std::string MaskKey(const std::string& key) {
  if (key.size() <= 8) return key;
  return key.substr(0, 8) + "...";
}

}  // namespace

TenantConnection::TenantConnection(std::string key, ConnectionOptions opt, Dependencies deps)
    : key_(std::move(key)),
      opt_(std::move(opt)),
      deps_(std::move(deps)),
      log_(deps_.logger, "mqtt " + MaskKey(key_)),
      backoff_(opt_.reconnect_base_ms, opt_.reconnect_max_ms, opt_.reconnect_factor),
      rng_(std::random_device{}()) {}

TenantConnection::~TenantConnection() {
  auto_reconnect_.store(false);
  stop_.Stop();
}

bool TenantConnection::Start() {
  std::lock_guard<std::mutex> wl(workers_mu_);
  if (!deps_.transport_factory) {
    log_.Error("cannot start: no broker transport factory");
    return false;
  }
  Phase expected = Phase::Idle;
  if (!phase_.compare_exchange_strong(expected, Phase::Connecting)) return false;

  auto_reconnect_.store(true);
  {
    std::lock_guard<std::mutex> lk(mu_);
    backoff_.Reset();
    reconnect_attempts_ = 0;
  }

  log_.Info("starting, broker " + common::net::JoinHostPort(opt_.host, opt_.port));
  connect_started_steady_ms_.store(timeu::SteadyMs());
  Post([this] { RecreateTransport(); });

  auto self = shared_from_this();
  io_worker_.Start([self] { self->IoLoop(); });
  health_worker_.Start([self] { self->HealthLoop(); });
  return true;
}

void TenantConnection::Stop() {
  {
    std::lock_guard<std::mutex> wl(workers_mu_);
    if (phase_.exchange(Phase::Stopped) == Phase::Stopped) return;
    auto_reconnect_.store(false);
    stop_.Stop();
  }
  log_.Info("stopping");

  const std::string waited = std::to_string(opt_.join_timeout_ms) + " ms";
  if (!reconnect_worker_.JoinFor(opt_.join_timeout_ms)) {
    log_.Warn("reconnect worker still running after " + waited + ", detached");
  }
  if (!health_worker_.JoinFor(opt_.join_timeout_ms)) {
    log_.Warn("health check still running after " + waited + ", detached");
  }
  if (!io_worker_.JoinFor(opt_.join_timeout_ms)) {
    log_.Warn("I/O thread still busy after " + waited + ", detached");
  }
  transport_connected_.store(false);
}

bool TenantConnection::TransitionTo(Phase to) {
  Phase cur = phase_.load();
  while (cur != Phase::Stopped) {
    if (phase_.compare_exchange_weak(cur, to)) return true;
  }
  return false;
}

void TenantConnection::Post(Op op) {
  std::lock_guard<std::mutex> lk(ops_mu_);
  ops_.push_back(std::move(op));
}

void TenantConnection::RunPendingOps() {
  std::deque<Op> batch;
  {
    std::lock_guard<std::mutex> lk(ops_mu_);
    batch.swap(ops_);
  }
  for (auto& op : batch) op();
}

void TenantConnection::IoLoop() {
  while (!stop_.Stopped()) {
    RunPendingOps();
    if (transport_) {
      MaybePing();
      transport_->Poll(opt_.io_poll_ms);
      transport_connected_.store(transport_->IsConnected());
    } else {
      (void)stop_.WaitFor(opt_.io_poll_ms);
    }
  }

  if (transport_) {
    transport_->Close();
    for (int i = 0; i < 3; ++i) transport_->Poll(10);
    transport_->SetListener(nullptr);
    transport_.reset();
  }
  transport_connected_.store(false);

  std::lock_guard<std::mutex> lk(ops_mu_);
  ops_.clear();
}

void TenantConnection::HealthLoop() {
  while (stop_.WaitFor(opt_.health_check_interval_ms)) {
    (void)RunHealthCheck();
  }
}

void TenantConnection::MaybePing() {
  if (!transport_connected_.load()) return;
  const std::int64_t now = timeu::SteadyMs();
  if (now - last_ping_steady_ms_ < opt_.heartbeat_interval_ms) return;
  last_ping_steady_ms_ = now;
  if (!transport_->Ping()) log_.Debug("ping not sent");
}

void TenantConnection::RecreateTransport() {
  if (transport_) {
    transport_->SetListener(nullptr);
    transport_->Close();
    transport_.reset();
  }
  transport_connected_.store(false);
  {
    // Subscriptions belong to the session being replaced.
    std::lock_guard<std::mutex> lk(mu_);
    subscribed_.clear();
  }

  transport_ = deps_.transport_factory();
  if (!transport_) {
    OnDisconnect(false, "transport factory returned nothing");
    return;
  }
  transport_->SetListener(this);

  mqtt::BrokerTransport::Options to;
  to.host = opt_.host;
  to.port = opt_.port;
  to.client_id = key_;
  to.keepalive_sec = opt_.keepalive_sec;

  last_ping_steady_ms_ = timeu::SteadyMs();
  connect_started_steady_ms_.store(last_ping_steady_ms_);
  if (!transport_->Connect(to)) OnDisconnect(false, "connect could not be started");
}

bool TenantConnection::ScheduleReconnect(const std::string& reason) {
  std::lock_guard<std::mutex> wl(workers_mu_);
  if (stop_.Stopped() || !auto_reconnect_.load()) return false;

  bool expected = false;
  if (!reconnect_scheduled_.compare_exchange_strong(expected, true)) {
    log_.Debug("reconnect already in flight (" + reason + ")");
    return false;
  }

  (void)TransitionTo(Phase::Reconnecting);
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++reconnects_scheduled_;
  }
  log_.Warn("scheduling reconnect: " + reason);

  auto self = shared_from_this();
  reconnect_worker_.Start([self] { self->ReconnectLoop(); });
  return true;
}

void TenantConnection::ReconnectLoop() {
  std::uniform_real_distribution<double> unit(0.0, 1.0);

  while (!stop_.Stopped() && auto_reconnect_.load() && phase_.load() != Phase::Connected) {
    std::int64_t delay_ms = 0;
    std::int64_t attempts = 0;
    {
      std::lock_guard<std::mutex> lk(mu_);
      attempts = reconnect_attempts_;
      delay_ms = backoff_.Jittered(unit(rng_));
    }

    if (opt_.max_reconnect_attempts > 0 && attempts >= opt_.max_reconnect_attempts) {
      log_.Error("giving up after " + std::to_string(attempts) + " reconnect attempts");
      auto_reconnect_.store(false);
      (void)TransitionTo(Phase::Disconnected);
      break;
    }

    if (!stop_.WaitFor(delay_ms)) break;
    if (phase_.load() == Phase::Connected) break;

    if (deps_.probe && !deps_.probe(opt_.host, opt_.port, opt_.probe_timeout_ms)) {
      log_.Warn("broker " + common::net::JoinHostPort(opt_.host, opt_.port) +
                " unreachable, attempt skipped");
      continue;
    }

    {
      std::lock_guard<std::mutex> lk(mu_);
      attempts = ++reconnect_attempts_;
    }
    attempt_failed_.store(false);
    (void)TransitionTo(Phase::Reconnecting);
    log_.Info("reconnect attempt " + std::to_string(attempts));

    Post([this] { RecreateTransport(); });
    const bool settled = stop_.WaitUntil(opt_.connect_wait_ms, [this] {
      return phase_.load() == Phase::Connected || attempt_failed_.load();
    });
    if (settled && phase_.load() == Phase::Connected) {
      log_.Info("reconnected after " + std::to_string(attempts) + " attempts");
      break;
    }
    if (stop_.Stopped()) break;

    std::int64_t next_ms = 0;
    {
      std::lock_guard<std::mutex> lk(mu_);
      next_ms = backoff_.Grow();
    }
    log_.Warn("reconnect attempt " + std::to_string(attempts) + " failed, next interval " +
              std::to_string(next_ms) + " ms");
  }

  reconnect_scheduled_.store(false);
}

std::string HealthProblem(const HealthSnapshot& s, const ConnectionOptions& opt) {
  switch (s.phase) {
    case Phase::Connected:
      if (s.heartbeat_silence_ms > opt.heartbeat_interval_ms + opt.heartbeat_timeout_ms) {
        return "no heartbeat for " + std::to_string(s.heartbeat_silence_ms) + " ms";
      }
      if (!s.transport_connected) return "transport reports not connected";
      return std::string();
    case Phase::Connecting:
      // No callback from the first connect, e.g. CONNACK never arrives.
      if (!s.transport_connected && s.connect_elapsed_ms > opt.connect_wait_ms) {
        return "connect pending for " + std::to_string(s.connect_elapsed_ms) + " ms";
      }
      return std::string();
    case Phase::Disconnected:
      if (s.auto_reconnect && !s.reconnect_scheduled) return "disconnected with no reconnect scheduled";
      return std::string();
    default:
      return std::string();
  }
}

bool TenantConnection::RunHealthCheck() {
  if (stop_.Stopped()) return false;

  HealthSnapshot snap;
  snap.phase = phase_.load();
  snap.transport_connected = transport_connected_.load();
  snap.auto_reconnect = auto_reconnect_.load();
  snap.reconnect_scheduled = reconnect_scheduled_.load();
  const std::int64_t now = timeu::SteadyMs();
  snap.connect_elapsed_ms = now - connect_started_steady_ms_.load();
  {
    std::lock_guard<std::mutex> lk(mu_);
    snap.heartbeat_silence_ms = now - last_heartbeat_steady_ms_;
  }

  const std::string problem = HealthProblem(snap, opt_);
  if (problem.empty()) return true;

  log_.Warn("health check: " + problem);
  if (snap.phase == Phase::Connected || snap.phase == Phase::Connecting) {
    Phase cur = snap.phase;
    (void)phase_.compare_exchange_strong(cur, Phase::Disconnected);
  }
  (void)ScheduleReconnect(problem);
  return false;
}

void TenantConnection::OnConnect(bool accepted, int code) {
  if (!accepted) {
    log_.Error("broker refused connection, code " + std::to_string(code));
    attempt_failed_.store(true);
    stop_.Notify();
    return;
  }
  if (!TransitionTo(Phase::Connected)) return;

  const std::int64_t now = timeu::NowUnixMs();
  {
    std::lock_guard<std::mutex> lk(mu_);
    backoff_.Reset();
    reconnect_attempts_ = 0;
    last_connect_ms_ = now;
    last_heartbeat_ms_ = now;
    last_heartbeat_steady_ms_ = timeu::SteadyMs();
  }
  transport_connected_.store(true);
  stop_.Notify();

  log_.Info("connected");
  SubscribeVisibleDevices();
}

void TenantConnection::OnDisconnect(bool graceful, const std::string& reason) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    last_disconnect_ms_ = timeu::NowUnixMs();
  }
  transport_connected_.store(false);
  attempt_failed_.store(true);
  stop_.Notify();

  Phase phase = phase_.load();
  if (phase == Phase::Stopped || phase == Phase::Idle) return;
  if (graceful && !auto_reconnect_.load()) return;

  log_.Warn("disconnected: " + reason);
  if (phase == Phase::Connected || phase == Phase::Connecting) {
    (void)phase_.compare_exchange_strong(phase, Phase::Disconnected);
  }
  (void)ScheduleReconnect(reason);
}

void TenantConnection::OnHeartbeat() {
  std::lock_guard<std::mutex> lk(mu_);
  last_heartbeat_ms_ = timeu::NowUnixMs();
  last_heartbeat_steady_ms_ = timeu::SteadyMs();
}

void TenantConnection::OnMessage(const std::string& topic, const std::string& payload) {
  OnHeartbeat();
  HandleMessage(topic, payload);
}

void TenantConnection::HandleMessage(const std::string& topic, const std::string& payload) {
  log_.Info("message on " + topic + ": " + payload);
  if (!deps_.devices) return;

  const auto device = deps_.devices->FindDeviceByTopic(topic);
  if (!device) {
    log_.Warn("no device for topic " + topic + ", message dropped");
    return;
  }
  if (!control::IsOpenCommand(payload)) {
    log_.Debug("payload for " + topic + " is not an open command");
    return;
  }
  if (!deps_.commands) {
    log_.Error("open command for " + topic + " dropped: no command handler");
    return;
  }
  (void)deps_.commands->Execute(*device, log_);
}

void TenantConnection::SubscribeVisibleDevices() {
  if (!deps_.devices || !transport_) return;

  for (const auto& d : deps_.devices->ListVisibleDevices()) {
    if (d.topic.empty()) continue;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (!subscribed_.insert(d.topic).second) continue;
    }
    if (transport_->Subscribe(d.topic)) {
      log_.Info("subscribed " + d.topic);
    } else {
      std::lock_guard<std::mutex> lk(mu_);
      subscribed_.erase(d.topic);
      log_.Warn("subscribe " + d.topic + " failed");
    }
  }
}

bool TenantConnection::Subscribe(const std::string& topic) {
  if (topic.empty() || phase_.load() != Phase::Connected) return false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!subscribed_.insert(topic).second) return false;
  }

  Post([this, topic] {
    if (transport_ && transport_->Subscribe(topic)) {
      log_.Info("subscribed " + topic);
      return;
    }
    std::lock_guard<std::mutex> lk(mu_);
    subscribed_.erase(topic);
    log_.Warn("subscribe " + topic + " failed");
  });
  return true;
}

bool TenantConnection::Unsubscribe(const std::string& topic) {
  if (topic.empty() || phase_.load() != Phase::Connected) return false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (subscribed_.erase(topic) == 0) return false;
  }

  Post([this, topic] {
    if (transport_ && transport_->Unsubscribe(topic)) {
      log_.Info("unsubscribed " + topic);
    } else {
      log_.Warn("unsubscribe " + topic + " failed");
    }
  });
  return true;
}

ConnectionStatus TenantConnection::Status() const {
  ConnectionStatus s;
  s.key = key_;
  s.phase = phase_.load();
  s.connected = s.phase == Phase::Connected;
  s.reconnect_active = reconnect_scheduled_.load();

  std::lock_guard<std::mutex> lk(mu_);
  s.reconnect_attempts = reconnect_attempts_;
  s.current_interval_ms = backoff_.Current();
  s.last_connect_ms = last_connect_ms_;
  s.last_disconnect_ms = last_disconnect_ms_;
  s.last_heartbeat_ms = last_heartbeat_ms_;
  s.subscribed_topics = subscribed_.size();
  s.reconnects_scheduled = reconnects_scheduled_;
  return s;
}

}  // namespace vtob::core::broker
