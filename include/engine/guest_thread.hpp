#pragma once

#include <boost/asio.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#ifdef __linux__
#include <pthread.h>
#endif

namespace engine {

namespace net = boost::asio;

// GuestThread
// Threading model:
// - Owns one io_context run by one std::jthread; every interpreter call of a
//   session is posted here, so jobs run one at a time in posting order
// - Destruction drains the queued jobs and joins
// - Abandon() is the only way out of a job that never returns: the
//   io_context is stopped and the thread detached. The thread keeps the
//   io_context (and whatever the running job captured) alive until the job
//   returns or the process exits; queued jobs are destroyed on that thread.
class GuestThread {
public:
  explicit GuestThread(std::string name)
      : name_(std::move(name)), ioc_(std::make_shared<net::io_context>(1)),
        abandoned_(std::make_shared<std::atomic<bool>>(false)) {
    work_guard_.emplace(ioc_->get_executor());
    thread_ = std::jthread([ioc = ioc_, name = name_] {
#ifdef __linux__
      // Linux caps thread names at 15 characters
      pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#endif
      ioc->run();
    });
  }

  GuestThread(const GuestThread &) = delete;
  GuestThread &operator=(const GuestThread &) = delete;

  ~GuestThread() {
    if (!Abandoned()) {
      work_guard_.reset();
    }
  }

  template <typename Job> void Post(Job &&job) {
    if (Abandoned()) {
      return;
    }
    net::post(*ioc_, std::forward<Job>(job));
  }

  // Posts a job that will never run but is destroyed on the guest thread
  // once that thread winds down; used to hand objects over before Abandon().
  template <typename Object> void Bury(Object &&object) {
    if (Abandoned()) {
      return;
    }
    net::post(*ioc_, [keep = std::forward<Object>(object)] { (void)keep; });
  }

  void Abandon() {
    if (abandoned_->exchange(true)) {
      return;
    }
    work_guard_.reset();
    ioc_->stop();
    thread_.detach();
  }

  bool Abandoned() const { return abandoned_->load(); }

  // Outlives the GuestThread; a job that finishes after Abandon() checks it
  // before reporting to a host that may already be gone.
  std::shared_ptr<const std::atomic<bool>> AbandonedFlag() const {
    return abandoned_;
  }

private:
  std::string name_;
  std::shared_ptr<net::io_context> ioc_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
  std::shared_ptr<std::atomic<bool>> abandoned_;
  std::jthread thread_;
};

} // namespace engine
