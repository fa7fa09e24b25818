#pragma once

#include "core/session_state.hpp"
#include "engine/guest_thread.hpp"
#include "engine/interpreter.hpp"
#include "logging/console.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace net = boost::asio;

// Session
// Threading model:
// - State and transitions live on the host executor (the reactor thread);
//   only the Controller and Supervisor drive them
// - The interpreter lives on the session's GuestThread; Dispatch() runs a job
//   there and posts its result back to the host executor
// - Terminate() while the guest thread is busy abandons it: the running job
//   cannot be unwound, so the environment is dropped instead of stopped
class Session {
public:
  Session(std::uint64_t id, net::any_io_executor host,
          std::shared_ptr<engine::IInterpreter> interpreter)
      : id_(id), host_(std::move(host)), interpreter_(std::move(interpreter)),
        guest_("guest-" + std::to_string(id)) {}

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  ~Session() {
    if (GuestBusy()) {
      Abandon();
    } else {
      ReleaseInterpreter();
    }
  }

  std::uint64_t Id() const { return id_; }
  SessionState State() const { return state_; }

  std::expected<void, TransitionError> Transition(SessionState to) {
    if (!IsTransitionAllowed(state_, to)) {
      return std::unexpected(TransitionError{state_, to});
    }
    if (to == SessionState::terminated) {
      Terminate();
      return {};
    }
    state_ = to;
    return {};
  }

  // Forces the absorbing state. Idempotent.
  void Terminate() {
    if (state_ == SessionState::terminated) {
      return;
    }
    const bool busy = GuestBusy();
    state_ = SessionState::terminated;
    if (busy) {
      Abandon();
    } else {
      ReleaseInterpreter();
    }
    logging::Console("session " + std::to_string(id_),
                     busy ? "terminated, guest thread abandoned"
                          : "terminated");
  }

  // Runs job(interpreter) on the guest thread; done(result) is posted to the
  // host executor. Result is a std::expected whose error is a message; a job
  // that throws reports what() through it. Nothing happens once the session
  // has dropped its interpreter.
  template <typename Result>
  void Dispatch(std::function<Result(engine::IInterpreter &)> job,
                std::function<void(Result)> done) {
    if (!interpreter_) {
      return;
    }
    guest_.Post([interpreter = interpreter_, host = host_,
                 abandoned = guest_.AbandonedFlag(), job = std::move(job),
                 done = std::move(done)]() mutable {
      Result result = RunGuarded<Result>(job, *interpreter);
      if (abandoned->load()) {
        return;
      }
      net::post(host, [done = std::move(done),
                       result = std::move(result)]() mutable {
        done(std::move(result));
      });
    });
  }

private:
  template <typename Result>
  static Result RunGuarded(std::function<Result(engine::IInterpreter &)> &job,
                           engine::IInterpreter &interpreter) {
    try {
      return job(interpreter);
    } catch (const std::exception &e) {
      return std::unexpected(std::string("interpreter fault: ") + e.what());
    }
  }

  bool GuestBusy() const {
    return state_ == SessionState::initializing ||
           state_ == SessionState::executing;
  }

  // The interpreter must die on its own thread.
  void ReleaseInterpreter() {
    if (interpreter_) {
      guest_.Post(
          [interpreter = std::move(interpreter_)]() mutable { interpreter.reset(); });
    }
  }

  void Abandon() {
    if (interpreter_) {
      guest_.Bury(std::move(interpreter_));
    }
    guest_.Abandon();
  }

  std::uint64_t id_;
  net::any_io_executor host_;
  SessionState state_ = SessionState::uninitialized;
  std::shared_ptr<engine::IInterpreter> interpreter_;
  engine::GuestThread guest_;
};
