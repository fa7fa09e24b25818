#pragma once

#include "exec/controller.hpp"
#include "io/file_writer.hpp"
#include "logging/console.hpp"
#include "protocol/codec.hpp"
#include <boost/asio.hpp>
#include <cerrno>
#include <cstring>
#include <functional>
#include <memory>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace net = boost::asio;

// StdioChannel
// Threading model:
// - One std::jthread reads newline-delimited requests from an input fd and
//   posts each complete line to the controller on the reactor
// - Responses are written by the reactor thread, one JSON line per
//   notification, in the order the controller emits them
// - poll() with a short timeout keeps the reader responsive to stop requests
// - End of input posts `on_eof` once, after the controller has answered every
//   request read before it; Stop() is the immediate path
class StdioChannel {
public:
  using ControllerFactory =
      std::function<std::shared_ptr<Controller>(Controller::Notify notify)>;

  StdioChannel(net::any_io_executor host, int in_fd, int out_fd)
      : host_(std::move(host)), in_fd_(in_fd), out_fd_(out_fd) {}

  StdioChannel(const StdioChannel &) = delete;
  StdioChannel &operator=(const StdioChannel &) = delete;

  ~StdioChannel() { Stop(); }

  // Must run on the reactor thread.
  void Start(const ControllerFactory &make_controller,
             std::function<void()> on_eof) {
    const int out_fd = out_fd_;
    controller_ = make_controller([out_fd](protocol::Response r) {
      std::string line = protocol::Serialize(r);
      line += '\n';
      if (!io::WriteAll(out_fd, line)) {
        logging::Console("stdio", std::string("response write failed: ") +
                                      std::strerror(errno));
      }
    });
    controller_->Start();
    std::weak_ptr<Controller> weak = controller_;
    reader_ = std::jthread([this, weak, on_eof = std::move(on_eof)](
                               std::stop_token stop) {
      ReadLoop(stop, weak);
      if (stop.stop_requested() || !on_eof) {
        return;
      }
      // queued behind the lines already posted, so they are all handled first
      net::post(host_, [weak, on_eof] {
        if (auto controller = weak.lock()) {
          controller->WhenIdle(on_eof);
        } else {
          on_eof();
        }
      });
    });
  }

  // Stops the reader and shuts the controller down. Must run on the reactor
  // thread (or after it has stopped).
  void Stop() {
    if (reader_.joinable()) {
      reader_.request_stop();
      reader_.join();
    }
    if (controller_) {
      controller_->Shutdown();
      controller_.reset();
    }
  }

private:
  void ReadLoop(const std::stop_token &stop,
                const std::weak_ptr<Controller> &weak) {
    std::string pending;
    char chunk[4096];
    while (!stop.stop_requested()) {
      pollfd pfd{in_fd_, POLLIN, 0};
      int ready = ::poll(&pfd, 1, 200);
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        logging::Console("stdio", std::string("poll failed: ") +
                                      std::strerror(errno));
        return;
      }
      if (ready == 0) {
        continue;
      }
      ssize_t n = ::read(in_fd_, chunk, sizeof(chunk));
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
          continue;
        }
        logging::Console("stdio", std::string("read failed: ") +
                                      std::strerror(errno));
        return;
      }
      if (n == 0) {
        // a last line without its newline still counts
        if (!pending.empty()) {
          Deliver(weak, std::move(pending));
        }
        logging::Console("stdio", "end of input");
        return;
      }
      pending.append(chunk, static_cast<std::size_t>(n));
      std::size_t start = 0;
      for (std::size_t nl = pending.find('\n', start); nl != std::string::npos;
           nl = pending.find('\n', start)) {
        Deliver(weak, pending.substr(start, nl - start));
        start = nl + 1;
      }
      pending.erase(0, start);
    }
  }

  void Deliver(const std::weak_ptr<Controller> &weak, std::string line) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.find_first_not_of(" \t") == std::string::npos) {
      return;
    }
    net::post(host_, [weak, line = std::move(line)] {
      if (auto controller = weak.lock()) {
        controller->HandleMessage(line);
      }
    });
  }

  net::any_io_executor host_;
  int in_fd_;
  int out_fd_;
  std::shared_ptr<Controller> controller_;
  std::jthread reader_;
};
