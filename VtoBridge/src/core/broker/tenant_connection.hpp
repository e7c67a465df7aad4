#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>

#include "core/broker/backoff.hpp"
#include "core/common/logger/logger.hpp"
#include "core/common/utils/thread_utils.hpp"
#include "core/control/door_command.hpp"
#include "core/device/manager/device_manager.hpp"
#include "core/device/protocol_adapters/mqtt_adapter/broker_transport.hpp"

namespace vtob::core::broker {

enum class Phase : std::uint8_t {
  Idle,
  Connecting,
  Connected,
  Reconnecting,
  Disconnected,  // dropped, reconnect not yet scheduled
  Stopped
};

const char* ToString(Phase phase);

struct ConnectionOptions {
  std::string host = "bemfa.com";
  std::uint16_t port = 9501;
  std::uint16_t keepalive_sec = 60;

  std::int64_t heartbeat_interval_ms = 30000;
  std::int64_t heartbeat_timeout_ms = 15000;
  std::int64_t health_check_interval_ms = 15000;

  std::int64_t reconnect_base_ms = 3000;
  std::int64_t reconnect_max_ms = 60000;
  double reconnect_factor = 1.3;
  std::int64_t max_reconnect_attempts = 0;  // 0: unbounded
  std::int64_t connect_wait_ms = 15000;
  int probe_timeout_ms = 3000;

  std::int64_t join_timeout_ms = 3000;
  int io_poll_ms = 50;
};

struct ConnectionStatus {
  std::string key;
  Phase phase = Phase::Idle;
  bool connected = false;
  std::int64_t reconnect_attempts = 0;
  std::int64_t current_interval_ms = 0;
  std::int64_t last_connect_ms = 0;
  std::int64_t last_disconnect_ms = 0;
  std::int64_t last_heartbeat_ms = 0;
  std::size_t subscribed_topics = 0;
  bool reconnect_active = false;
  std::int64_t reconnects_scheduled = 0;
};

// Inputs of one health pass, sampled together.
struct HealthSnapshot {
  Phase phase = Phase::Idle;
  bool transport_connected = false;
  bool auto_reconnect = false;
  bool reconnect_scheduled = false;
  std::int64_t heartbeat_silence_ms = 0;  // since the last heartbeat
  std::int64_t connect_elapsed_ms = 0;    // since the current connect began
};

// Empty when healthy, otherwise a short description of the problem.
std::string HealthProblem(const HealthSnapshot& s, const ConnectionOptions& opt);

using ReachabilityProbe = std::function<bool(const std::string& host, std::uint16_t port, int timeout_ms)>;

// One broker session for one tenant key, kept alive across drops.
//
// Threads: an I/O thread owns the transport (every transport call, and
// every listener callback, happens there); a health thread checks
// liveness every health_check_interval_ms; at most one reconnect worker
// exists at a time. Open commands are actuated synchronously on the I/O
// thread, so one slow door only delays this tenant.
//
// Must be owned by a std::shared_ptr; background threads keep it alive.
class TenantConnection final
    : public device::protocol_adapters::mqtt::BrokerListener,
      public std::enable_shared_from_this<TenantConnection> {
public:
  struct Dependencies {
    std::shared_ptr<device::manager::DeviceDirectory> devices;
    std::shared_ptr<control::DoorCommandHandler> commands;
    device::protocol_adapters::mqtt::TransportFactory transport_factory;
    ReachabilityProbe probe;
    std::shared_ptr<common::log::Logger> logger;
  };

  TenantConnection(std::string key, ConnectionOptions opt, Dependencies deps);
  ~TenantConnection() override;

  TenantConnection(const TenantConnection&) = delete;
  TenantConnection& operator=(const TenantConnection&) = delete;

  const std::string& Key() const { return key_; }

  // IDLE -> CONNECTING. False if already started or stopped.
  bool Start();
  // Any phase -> STOPPED. Joins background threads with a bounded wait.
  void Stop();

  // Both return true when a broker call was issued; false when not
  // connected or already in the requested state. The topic set behind
  // Status().subscribed_topics is updated before the broker call runs; a
  // failed call is logged at Warn and the set is rebuilt on reconnect.
  bool Subscribe(const std::string& topic);
  bool Unsubscribe(const std::string& topic);

  bool IsConnected() const { return phase_.load() == Phase::Connected; }
  Phase CurrentPhase() const { return phase_.load(); }
  ConnectionStatus Status() const;

  // One pass of the health loop; false when a problem was found.
  bool RunHealthCheck();

  // BrokerListener, called on the I/O thread.
  void OnConnect(bool accepted, int code) override;
  void OnMessage(const std::string& topic, const std::string& payload) override;
  void OnDisconnect(bool graceful, const std::string& reason) override;
  void OnHeartbeat() override;

private:
  using Op = std::function<void()>;

  void Post(Op op);
  void RunPendingOps();
  void IoLoop();
  void HealthLoop();
  void ReconnectLoop();

  bool ScheduleReconnect(const std::string& reason);
  void RecreateTransport();
  void SubscribeVisibleDevices();
  void HandleMessage(const std::string& topic, const std::string& payload);
  void MaybePing();
  bool TransitionTo(Phase to);

private:
  const std::string key_;
  const ConnectionOptions opt_;
  const Dependencies deps_;
  const common::log::TaggedLogger log_;

  std::atomic<Phase> phase_{Phase::Idle};
  std::atomic<bool> auto_reconnect_{false};
  std::atomic<bool> reconnect_scheduled_{false};
  std::atomic<bool> attempt_failed_{false};
  std::atomic<bool> transport_connected_{false};
  std::atomic<std::int64_t> connect_started_steady_ms_{0};

  mutable std::mutex mu_;
  std::set<std::string> subscribed_;
  Backoff backoff_;
  std::int64_t reconnect_attempts_ = 0;
  std::int64_t reconnects_scheduled_ = 0;
  std::int64_t last_connect_ms_ = 0;
  std::int64_t last_disconnect_ms_ = 0;
  std::int64_t last_heartbeat_ms_ = 0;
  std::int64_t last_heartbeat_steady_ms_ = 0;
  std::mt19937 rng_;

  std::mutex ops_mu_;
  std::deque<Op> ops_;

  // I/O thread only.
  std::unique_ptr<device::protocol_adapters::mqtt::BrokerTransport> transport_;
  std::int64_t last_ping_steady_ms_ = 0;

  std::mutex workers_mu_;
  common::thread::StopSignal stop_;
  common::thread::Worker io_worker_;
  common::thread::Worker health_worker_;
  common::thread::Worker reconnect_worker_;
};

}  // namespace vtob::core::broker
