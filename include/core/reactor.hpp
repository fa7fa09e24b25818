#pragma once

#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns the single io_context that hosts controllers, supervisors, deadline
//   timers and transport coroutines
// - Runs io_context::run() on one std::jthread: controller and session state
//   is only touched from that thread, which is what serializes requests
// - Guest threads post their completions here
class Reactor {
public:
  Reactor() = default;

  net::io_context &GetIoContext() { return ioc_; }
  net::any_io_executor GetExecutor() { return ioc_.get_executor(); }

  void Start() {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    if (thread_.joinable()) {
      return;
    }
    thread_ = std::jthread([this] { ioc_.run(); });
  }

  // Lets queued handlers finish, then stops.
  void Drain() {
    if (work_guard_.has_value()) {
      work_guard_.reset();
    }
  }

  void Stop() {
    Drain();
    ioc_.stop();
  }

  void Join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
      thread_.join();
    }
  }

  ~Reactor() {
    Stop();
    Join();
  }

private:
  net::io_context ioc_{1};
  std::jthread thread_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};
