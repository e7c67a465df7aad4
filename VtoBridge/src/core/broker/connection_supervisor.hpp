#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/broker/tenant_connection.hpp"
#include "core/cloud/topic_sync.hpp"
#include "core/common/logger/logger.hpp"
#include "core/common/utils/thread_utils.hpp"
#include "core/device/manager/device_manager.hpp"

namespace vtob::core::broker {

struct SupervisorOptions {
  std::int64_t reconcile_interval_ms = 60000;
  std::int64_t join_timeout_ms = 3000;
};

struct ReconcileReport {
  std::vector<std::string> started;
  std::vector<std::string> stopped;
  std::vector<std::string> kept;
};

// Builds an unstarted connection for one account.
using ConnectionFactory =
    std::function<std::shared_ptr<TenantConnection>(const device::model::TenantAccount& account)>;

// Owns every TenantConnection of the process, keyed by account key, and
// converges that set to the enabled accounts.
//
// StartAll, Reconcile, Restart and StopAll are serialized against each
// other; the connection map has its own lock so status queries and topic
// fan-out never wait on a reconcile in progress.
//
// Must be owned by a std::shared_ptr when the reconcile loop is used.
class ConnectionSupervisor : public std::enable_shared_from_this<ConnectionSupervisor> {
public:
  ConnectionSupervisor(SupervisorOptions opt,
                       std::shared_ptr<device::manager::AccountDirectory> accounts,
                       ConnectionFactory factory, std::shared_ptr<common::log::Logger> logger);
  ~ConnectionSupervisor();

  ConnectionSupervisor(const ConnectionSupervisor&) = delete;
  ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

  // Remote topic reconciliation run once before the first StartAll, and on
  // demand through SyncRemoteTopics. Optional.
  void SetTopicSync(std::shared_ptr<cloud::TopicCatalogSync> sync);

  // Starts, or restarts, one connection per enabled account. Returns the
  // number of connections running afterwards.
  std::size_t StartAll();
  ReconcileReport Reconcile();
  void StopAll();
  bool Restart(const std::string& key);

  // Applied to every managed connection; returns how many issued the call.
  std::size_t SubscribeTopic(const std::string& topic);
  std::size_t UnsubscribeTopic(const std::string& topic);

  // True iff at least one managed connection is connected.
  bool IsConnected() const;
  std::map<std::string, ConnectionStatus> GetStatus() const;
  std::size_t Size() const;
  std::shared_ptr<TenantConnection> Find(const std::string& key) const;

  // One ReconcileRemoteTopics per enabled account. False when no sync is
  // registered.
  bool SyncRemoteTopics();
  bool InitialSyncDone() const { return initial_sync_done_.load(); }

  bool StartReconcileLoop();
  void StopReconcileLoop();

private:
  std::shared_ptr<TenantConnection> Launch(const device::model::TenantAccount& account);
  void StopConnection(const std::shared_ptr<TenantConnection>& conn);
  std::vector<std::shared_ptr<TenantConnection>> Snapshot() const;
  void ReconcileLoop();

private:
  const SupervisorOptions opt_;
  const std::shared_ptr<device::manager::AccountDirectory> accounts_;
  const ConnectionFactory factory_;
  const common::log::TaggedLogger log_;

  std::mutex reconcile_mu_;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<TenantConnection>> connections_;
  std::shared_ptr<cloud::TopicCatalogSync> topic_sync_;

  std::atomic<bool> initial_sync_done_{false};

  std::mutex loop_mu_;
  common::thread::StopSignal loop_stop_;
  common::thread::Worker loop_worker_;
};

}  // namespace vtob::core::broker
