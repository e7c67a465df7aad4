#include "core/broker/connection_supervisor.hpp"

#include <exception>
#include <optional>
#include <utility>

namespace vtob::core::broker {

using device::model::TenantAccount;

ConnectionSupervisor::ConnectionSupervisor(SupervisorOptions opt,
                                           std::shared_ptr<device::manager::AccountDirectory> accounts,
                                           ConnectionFactory factory,
                                           std::shared_ptr<common::log::Logger> logger)
    : opt_(opt),
      accounts_(std::move(accounts)),
      factory_(std::move(factory)),
      log_(std::move(logger), "supervisor") {}

ConnectionSupervisor::~ConnectionSupervisor() {
  loop_stop_.Stop();
  StopAll();
}

void ConnectionSupervisor::SetTopicSync(std::shared_ptr<cloud::TopicCatalogSync> sync) {
  std::lock_guard<std::mutex> lk(mu_);
  topic_sync_ = std::move(sync);
}

std::shared_ptr<TenantConnection> ConnectionSupervisor::Launch(const TenantAccount& account) {
  if (!factory_) {
    log_.Error("no connection factory, cannot start " + account.name);
    return nullptr;
  }

  std::shared_ptr<TenantConnection> conn;
  try {
    conn = factory_(account);
  } catch (const std::exception& e) {
    log_.Error("building connection for " + account.name + " failed: " + e.what());
    return nullptr;
  }
  if (!conn) {
    log_.Error("connection factory returned nothing for " + account.name);
    return nullptr;
  }
  if (!conn->Start()) {
    log_.Error("connection for " + account.name + " did not start");
    return nullptr;
  }
  log_.Info("started connection for " + account.name);
  return conn;
}

void ConnectionSupervisor::StopConnection(const std::shared_ptr<TenantConnection>& conn) {
  if (!conn) return;
  conn->Stop();
}

std::vector<std::shared_ptr<TenantConnection>> ConnectionSupervisor::Snapshot() const {
  std::vector<std::shared_ptr<TenantConnection>> out;
  std::lock_guard<std::mutex> lk(mu_);
  out.reserve(connections_.size());
  for (const auto& kv : connections_) out.push_back(kv.second);
  return out;
}

bool ConnectionSupervisor::SyncRemoteTopics() {
  std::shared_ptr<cloud::TopicCatalogSync> sync;
  {
    std::lock_guard<std::mutex> lk(mu_);
    sync = topic_sync_;
  }
  if (!sync) return false;
  if (!accounts_) return true;

  for (const auto& account : accounts_->ListEnabledAccounts()) {
    const cloud::TopicSyncReport r = sync->ReconcileRemoteTopics(account.key);
    const std::string line = "topic sync " + account.name + ": created " + std::to_string(r.created) +
                             ", updated " + std::to_string(r.updated) + ", deleted " +
                             std::to_string(r.deleted) + ", failed " + std::to_string(r.failed);
    if (r.failed > 0) {
      log_.Warn(line);
    } else {
      log_.Info(line);
    }
  }
  return true;
}

std::size_t ConnectionSupervisor::StartAll() {
  std::lock_guard<std::mutex> rl(reconcile_mu_);

  if (!initial_sync_done_.exchange(true) && !SyncRemoteTopics()) {
    log_.Info("no topic sync registered, remote topic reconciliation skipped");
  }

  if (!accounts_) {
    log_.Error("no account directory, nothing to start");
    return 0;
  }

  for (const TenantAccount& account : accounts_->ListEnabledAccounts()) {
    if (account.key.empty()) {
      log_.Warn("account " + account.name + " has no key, skipped");
      continue;
    }

    std::shared_ptr<TenantConnection> previous;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = connections_.find(account.key);
      if (it != connections_.end()) {
        previous = std::move(it->second);
        connections_.erase(it);
      }
    }
    if (previous) {
      log_.Info("restarting connection for " + account.name);
      StopConnection(previous);
    }

    auto conn = Launch(account);
    if (!conn) continue;
    std::lock_guard<std::mutex> lk(mu_);
    connections_[account.key] = std::move(conn);
  }
  return Size();
}

ReconcileReport ConnectionSupervisor::Reconcile() {
  std::lock_guard<std::mutex> rl(reconcile_mu_);
  ReconcileReport report;
  if (!accounts_) return report;

  std::map<std::string, TenantAccount> desired;
  for (const TenantAccount& account : accounts_->ListEnabledAccounts()) {
    if (!account.key.empty()) desired.emplace(account.key, account);
  }

  std::vector<std::shared_ptr<TenantConnection>> to_stop;
  std::vector<TenantAccount> to_start;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = connections_.begin(); it != connections_.end();) {
      if (desired.count(it->first) == 0) {
        report.stopped.push_back(it->first);
        to_stop.push_back(std::move(it->second));
        it = connections_.erase(it);
      } else {
        report.kept.push_back(it->first);
        ++it;
      }
    }
    for (const auto& kv : desired) {
      if (connections_.count(kv.first) == 0) to_start.push_back(kv.second);
    }
  }

  for (const auto& conn : to_stop) {
    log_.Info("account no longer enabled, stopping its connection");
    StopConnection(conn);
  }

  for (const TenantAccount& account : to_start) {
    auto conn = Launch(account);
    if (!conn) continue;
    report.started.push_back(account.key);
    std::lock_guard<std::mutex> lk(mu_);
    connections_[account.key] = std::move(conn);
  }

  if (!report.started.empty() || !report.stopped.empty()) {
    log_.Info("reconcile: started " + std::to_string(report.started.size()) + ", stopped " +
              std::to_string(report.stopped.size()) + ", kept " +
              std::to_string(report.kept.size()));
  }
  return report;
}

bool ConnectionSupervisor::Restart(const std::string& key) {
  std::lock_guard<std::mutex> rl(reconcile_mu_);
  if (!accounts_) return false;

  std::optional<TenantAccount> account;
  for (const TenantAccount& a : accounts_->ListEnabledAccounts()) {
    if (a.key == key) {
      account = a;
      break;
    }
  }
  if (!account) return false;

  std::shared_ptr<TenantConnection> previous;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(key);
    if (it != connections_.end()) {
      previous = std::move(it->second);
      connections_.erase(it);
    }
  }
  StopConnection(previous);

  auto conn = Launch(*account);
  if (!conn) return false;
  std::lock_guard<std::mutex> lk(mu_);
  connections_[key] = std::move(conn);
  return true;
}

void ConnectionSupervisor::StopAll() {
  std::lock_guard<std::mutex> rl(reconcile_mu_);
  std::map<std::string, std::shared_ptr<TenantConnection>> all;
  {
    std::lock_guard<std::mutex> lk(mu_);
    all.swap(connections_);
  }
  if (all.empty()) return;

  log_.Info("stopping " + std::to_string(all.size()) + " connections");
  for (auto& kv : all) StopConnection(kv.second);
}

std::size_t ConnectionSupervisor::SubscribeTopic(const std::string& topic) {
  std::size_t issued = 0;
  for (const auto& conn : Snapshot()) {
    try {
      if (conn->Subscribe(topic)) ++issued;
    } catch (const std::exception& e) {
      log_.Warn("subscribe " + topic + " failed on one connection: " + e.what());
    }
  }
  return issued;
}

std::size_t ConnectionSupervisor::UnsubscribeTopic(const std::string& topic) {
  std::size_t issued = 0;
  for (const auto& conn : Snapshot()) {
    try {
      if (conn->Unsubscribe(topic)) ++issued;
    } catch (const std::exception& e) {
      log_.Warn("unsubscribe " + topic + " failed on one connection: " + e.what());
    }
  }
  return issued;
}

bool ConnectionSupervisor::IsConnected() const {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& kv : connections_) {
    if (kv.second->IsConnected()) return true;
  }
  return false;
}

std::map<std::string, ConnectionStatus> ConnectionSupervisor::GetStatus() const {
  std::map<std::string, ConnectionStatus> out;
  for (const auto& conn : Snapshot()) out.emplace(conn->Key(), conn->Status());
  return out;
}

std::size_t ConnectionSupervisor::Size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return connections_.size();
}

std::shared_ptr<TenantConnection> ConnectionSupervisor::Find(const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = connections_.find(key);
  return it == connections_.end() ? nullptr : it->second;
}

bool ConnectionSupervisor::StartReconcileLoop() {
  std::lock_guard<std::mutex> ll(loop_mu_);
  if (loop_worker_.Running()) return false;

  loop_stop_.Reset();
  auto self = shared_from_this();
  loop_worker_.Start([self] { self->ReconcileLoop(); });
  log_.Info("reconcile loop every " + std::to_string(opt_.reconcile_interval_ms) + " ms");
  return true;
}

void ConnectionSupervisor::StopReconcileLoop() {
  std::lock_guard<std::mutex> ll(loop_mu_);
  loop_stop_.Stop();
  if (!loop_worker_.JoinFor(opt_.join_timeout_ms)) {
    log_.Warn("reconcile loop still busy after " + std::to_string(opt_.join_timeout_ms) +
              " ms, detached");
  }
}

void ConnectionSupervisor::ReconcileLoop() {
  while (loop_stop_.WaitFor(opt_.reconcile_interval_ms)) {
    (void)Reconcile();
  }
}

}  // namespace vtob::core::broker
