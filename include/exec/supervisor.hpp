#pragma once

#include "capture/output_capture.hpp"
#include "core/session.hpp"
#include "engine/interpreter.hpp"
#include "exec/execution.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace net = boost::asio;

// Supervisor
// Threading model:
// - Lives on the host executor (reactor thread) together with its sessions
// - Each run is a race between two completions delivered to the reactor:
//   the guest job posted back from the GuestThread, and a steady_timer
//   armed for the deadline. Whichever handler runs first settles the run;
//   the loser finds no matching pending run and is ignored
// - A lost guest job is not stopped: the session is terminated and its
//   guest thread abandoned
// Per run, the guest thread performs clear -> capture -> job -> release ->
// read as one job, so two runs never interleave.
class Supervisor : public std::enable_shared_from_this<Supervisor> {
public:
  using GuestJob = std::function<engine::OpResult(engine::IInterpreter &)>;
  using Completion = std::function<void(ExecutionResult)>;

  // Longest deadline the timer can hold. steady_timer counts nanoseconds, so
  // a larger millisecond count would overflow on conversion.
  static constexpr std::chrono::milliseconds kMaxDeadline =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          net::steady_timer::duration::max()) /
      2;

  explicit Supervisor(net::any_io_executor host) : host_(std::move(host)) {}

  bool Busy() const { return pending_.has_value(); }

  // Starts a run on a ready session. The completion fires exactly once, on
  // the host executor; it never fires synchronously from Run().
  std::expected<void, TransitionError>
  Run(std::shared_ptr<Session> session, GuestJob job,
      std::chrono::milliseconds timeout, Completion done) {
    if (auto st = session->Transition(SessionState::executing); !st) {
      return st;
    }
    const std::uint64_t id = next_id_++;
    pending_.emplace(PendingRun{id, session, timeutil::Stopwatch{},
                                std::make_unique<net::steady_timer>(host_),
                                std::move(done)});

    std::weak_ptr<Supervisor> weak = weak_from_this();
    pending_->timer->expires_after(std::min(timeout, kMaxDeadline));
    pending_->timer->async_wait([weak, id](const boost::system::error_code &ec) {
      if (auto self = weak.lock()) {
        self->OnDeadline(id, ec);
      }
    });

    session->Dispatch<std::expected<GuestRun, std::string>>(
        [job = std::move(job)](engine::IInterpreter &interpreter)
            -> std::expected<GuestRun, std::string> {
          capture::ICaptureBuffer &buffer = interpreter.Output();
          buffer.Clear();
          GuestRun run;
          {
            capture::CaptureScope scope(buffer);
            run.status = job(interpreter);
          }
          run.output = buffer.Read();
          return run;
        },
        [weak, id](std::expected<GuestRun, std::string> run) {
          if (auto self = weak.lock()) {
            self->OnGuestFinished(id, std::move(run));
          }
        });
    return {};
  }

  // Settles the in-flight run as interrupted and terminates its session.
  // Returns false when nothing was running.
  bool Abort(const std::string &reason) {
    if (!pending_) {
      return false;
    }
    PendingRun run = TakePending();
    run.session->Terminate();
    run.done(
        ExecutionResult::Interrupted(reason, run.stopwatch.ElapsedMillis()));
    return true;
  }

private:
  struct GuestRun {
    engine::OpResult status;
    capture::CapturedOutput output;
  };

  struct PendingRun {
    std::uint64_t id;
    std::shared_ptr<Session> session;
    timeutil::Stopwatch stopwatch;
    std::unique_ptr<net::steady_timer> timer;
    Completion done;
  };

  bool Matches(std::uint64_t id) const {
    return pending_.has_value() && pending_->id == id;
  }

  PendingRun TakePending() {
    PendingRun run = std::move(*pending_);
    pending_.reset();
    run.timer->cancel();
    return run;
  }

  void OnGuestFinished(std::uint64_t id,
                       std::expected<GuestRun, std::string> guest) {
    if (!Matches(id)) {
      return;
    }
    PendingRun run = TakePending();
    const double elapsed = run.stopwatch.ElapsedMillis();
    if (auto st = run.session->Transition(SessionState::ready); !st) {
      logging::Console("supervisor", st.error().Message());
    }
    if (!guest) {
      run.done(ExecutionResult::Error(guest.error(), {}, elapsed));
      return;
    }
    if (!guest->status) {
      run.done(ExecutionResult::Error(guest->status.error(), guest->output,
                                      elapsed));
      return;
    }
    run.done(ExecutionResult::Success(guest->output, elapsed));
  }

  void OnDeadline(std::uint64_t id, const boost::system::error_code &ec) {
    if (ec == net::error::operation_aborted || !Matches(id)) {
      return;
    }
    PendingRun run = TakePending();
    const double elapsed = run.stopwatch.ElapsedMillis();
    logging::Console("supervisor",
                     "session " + std::to_string(run.session->Id()) +
                         " missed its deadline");
    run.session->Terminate();
    run.done(ExecutionResult::Interrupted(kTimeoutMessage, elapsed));
  }

  net::any_io_executor host_;
  std::optional<PendingRun> pending_;
  std::uint64_t next_id_ = 1;
};
