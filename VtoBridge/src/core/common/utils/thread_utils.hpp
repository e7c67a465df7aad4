#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace vtob::core::common::thread {

// Cancellation flag shared by the background loops of one owner. Every sleep
// goes through WaitFor so a Stop() is observed within one period.
class StopSignal {
public:
  void Stop() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      stopped_.store(true);
    }
    cv_.notify_all();
  }

  void Reset() {
    std::lock_guard<std::mutex> lk(mu_);
    stopped_.store(false);
  }

  bool Stopped() const { return stopped_.load(); }

  // Returns false when stopped before the timeout elapsed.
  bool WaitFor(std::int64_t ms) {
    if (ms <= 0) return !Stopped();
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, std::chrono::milliseconds(ms), [this] { return stopped_.load(); });
    return !stopped_.load();
  }

  // Wakes waiters whose predicate may have changed without stopping them.
  // Callers must not hold a lock that a WaitUntil predicate takes.
  void Notify() {
    { std::lock_guard<std::mutex> lk(mu_); }
    cv_.notify_all();
  }

  // Waits until pred() is true, the timeout elapses, or Stop() is called.
  template <typename Pred>
  bool WaitUntil(std::int64_t ms, Pred pred) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, std::chrono::milliseconds(ms), [&] { return stopped_.load() || pred(); });
    return !stopped_.load() && pred();
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::atomic<bool> stopped_{false};
};

// std::thread with a bounded join. A worker that does not finish in time is
// detached; its body must hold whatever it needs alive.
class Worker {
public:
  Worker() = default;
  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;

  ~Worker() {
    if (!thread_.joinable()) return;
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }

  // A previous, already finished thread is reaped first.
  void Start(std::function<void()> body) {
    if (thread_.joinable()) {
      if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
      } else {
        thread_.join();
      }
    }
    std::promise<void> done;
    done_ = done.get_future();
    running_ = std::make_shared<std::atomic<bool>>(true);
    thread_ = std::thread([running = running_, body = std::move(body),
                           done = std::move(done)]() mutable {
      body();
      running->store(false);
      done.set_value();
    });
  }

  bool Running() const { return running_ && running_->load(); }
  bool Joinable() const { return thread_.joinable(); }

  // True when the thread finished (or never started) within timeout_ms.
  bool JoinFor(std::int64_t timeout_ms) {
    if (!thread_.joinable()) return true;
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
      return true;
    }
    if (done_.valid() &&
        done_.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
      thread_.detach();
      return false;
    }
    thread_.join();
    return true;
  }

private:
  std::thread thread_;
  std::future<void> done_;
  std::shared_ptr<std::atomic<bool>> running_;
};

}  // namespace vtob::core::common::thread
