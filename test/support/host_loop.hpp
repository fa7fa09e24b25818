#pragma once

#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <chrono>
#include <functional>

namespace fake {

namespace net = boost::asio;

// Plays the reactor on the test thread: handlers only run inside RunUntil,
// so assertions between calls see a quiescent host.
class HostLoop {
public:
  HostLoop() : guard_(ioc_.get_executor()) {}

  net::any_io_executor Executor() { return ioc_.get_executor(); }
  net::io_context &Context() { return ioc_; }

  // Runs handlers until `done` holds or `limit` passes; returns `done()`.
  bool RunUntil(const std::function<bool()> &done,
                std::chrono::milliseconds limit = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }
      ioc_.run_one_for(std::chrono::milliseconds(10));
    }
    return true;
  }

  // Runs whatever is ready or becomes ready within `window`.
  void RunFor(std::chrono::milliseconds window) {
    const auto deadline = std::chrono::steady_clock::now() + window;
    while (std::chrono::steady_clock::now() < deadline) {
      ioc_.run_one_for(std::chrono::milliseconds(5));
    }
  }

private:
  net::io_context ioc_{1};
  net::executor_work_guard<net::io_context::executor_type> guard_;
};

} // namespace fake
