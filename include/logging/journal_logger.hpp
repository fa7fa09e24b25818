#pragma once

#include "io/file_writer.hpp"
#include "logging/console.hpp"
#include "logging/journal_event.hpp"
#include <atomic>
#include <charconv>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <string>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace logging {

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ =
        std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_relaxed);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// JournalLogger
// Threading model:
// - Single background thread drains the journal SPSC queue and appends one
//   line per finished request with writev
// - Producers push from the reactor thread only; the logger is the single
//   consumer
// Line format:
//   <epoch_ms> controller=<n> session=<id> request=<kind> outcome=<o>
//   time_ms=<t.ttt|->
class JournalLogger : public LoggerBase<JournalLogger> {
public:
  explicit JournalLogger(const std::string &path)
      : queue_(std::make_shared<JournalQueue>()) {
    fd_ = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC,
                 0644);
  }

  ~JournalLogger() {
    Join();
    if (fd_ != -1) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  bool OpenOk() const { return fd_ != -1; }

  std::shared_ptr<JournalQueue> Queue() const { return queue_; }

  void RunLoop() {
    for (;;) {
      if (!this->running_.load(std::memory_order_relaxed)) {
        break;
      }
      if (Drain() == 0) {
        // journal traffic is one line per request; no need to spin
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
    }
    Drain();
  }

  static std::size_t FormatLine(const JournalEvent &ev, char *out,
                                std::size_t cap) {
    char *p = out;
    char *end = out + cap;
    auto put_int = [&](std::int64_t v) {
      auto [ptr, ec] = std::to_chars(p, end, v);
      if (ec == std::errc()) {
        p = ptr;
      }
    };
    auto put_str = [&](const char *s) {
      std::size_t n = std::strlen(s);
      if (static_cast<std::size_t>(end - p) >= n) {
        std::memcpy(p, s, n);
        p += n;
      }
    };
    put_int(ev.epoch_ms);
    put_str(" controller=");
    put_int(ev.controller);
    put_str(" session=");
    put_int(static_cast<std::int64_t>(ev.session_id));
    put_str(" request=");
    put_str(ToString(ev.request));
    put_str(" outcome=");
    put_str(ToString(ev.outcome));
    put_str(" time_ms=");
    if (ev.execution_us < 0) {
      put_str("-");
    } else {
      put_int(ev.execution_us / 1000);
      put_str(".");
      const std::int64_t frac = ev.execution_us % 1000;
      if (frac < 100) {
        put_str(frac < 10 ? "00" : "0");
      }
      put_int(frac);
    }
    put_str("\n");
    return static_cast<std::size_t>(p - out);
  }

private:
  static constexpr int kBatch = 64;
  static constexpr std::size_t kLineCap = 160;

  // Returns the number of events written
  std::size_t Drain() {
    if (fd_ == -1) {
      JournalEvent ev;
      std::size_t dropped = 0;
      while (queue_->pop(ev)) {
        ++dropped;
      }
      return dropped;
    }
    JournalEvent ev;
    struct iovec iov[kBatch];
    char lines[kBatch][kLineCap];
    int cnt = 0;
    std::size_t total = 0;
    // batch consume to reduce syscalls
    while (queue_->pop(ev)) {
      std::size_t len = FormatLine(ev, lines[cnt], kLineCap);
      iov[cnt] = {lines[cnt], len};
      ++cnt;
      ++total;
      if (cnt == kBatch) {
        Flush(iov, cnt);
        cnt = 0;
      }
    }
    if (cnt > 0) {
      Flush(iov, cnt);
    }
    return total;
  }

  void Flush(struct iovec *iov, int cnt) {
    if (!io::WritevAll(fd_, iov, cnt) && !write_failed_) {
      write_failed_ = true;
      Console("journal", std::string("write failed: ") + std::strerror(errno));
    }
  }

  std::shared_ptr<JournalQueue> queue_;
  int fd_ = -1;
  bool write_failed_ = false;
};

} // namespace logging
