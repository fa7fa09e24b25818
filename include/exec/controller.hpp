#pragma once

#include "core/session.hpp"
#include "engine/interpreter.hpp"
#include "engine/project_files.hpp"
#include "exec/execution.hpp"
#include "exec/supervisor.hpp"
#include "logging/console.hpp"
#include "logging/journal_event.hpp"
#include "protocol/codec.hpp"
#include "protocol/messages.hpp"
#include "util/time.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace net = boost::asio;

inline constexpr const char *kRestartRequiredMessage =
    "Execution interrupted (worker restart required)";
inline constexpr const char *kInitInterruptedMessage =
    "Initialization interrupted";

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

struct ControllerSettings {
  std::chrono::milliseconds default_timeout{30000};
  std::chrono::milliseconds install_timeout{120000};
  bool eager_init = true;
};

// Controller
// Threading model:
// - Every public method runs on the host executor (reactor thread); the
//   transports post decoded messages there, so requests are fully serialized
// - Owns at most one Session at a time and one Supervisor; sessions are built
//   by the injected factory, which is also how a terminated session is
//   replaced (restart)
// - Notifications leave through `notify` in request-acceptance order; every
//   accepted request gets exactly one terminal notification (install also
//   sends an `installing` progress note first)
// Must be owned by a std::shared_ptr: async completions hold weak references.
class Controller : public std::enable_shared_from_this<Controller> {
public:
  using Notify = std::function<void(protocol::Response)>;
  using SessionFactory = std::function<std::shared_ptr<Session>()>;

  Controller(std::uint32_t index, net::any_io_executor host,
             SessionFactory make_session, ControllerSettings settings,
             Notify notify,
             std::shared_ptr<logging::JournalQueue> journal = nullptr)
      : index_(index), host_(host), make_session_(std::move(make_session)),
        settings_(settings), notify_(std::move(notify)),
        journal_(std::move(journal)),
        supervisor_(std::make_shared<Supervisor>(std::move(host))) {}

  ~Controller() { Shutdown(); }

  // Eager initialization: the environment starts loading without waiting for
  // an explicit init.
  void Start() {
    if (settings_.eager_init) {
      OnInit(std::nullopt);
    }
  }

  SessionState State() const {
    return session_ ? session_->State() : SessionState::uninitialized;
  }

  // Nothing owed to the client: no run in flight and no load pending.
  bool Idle() const { return !supervisor_->Busy() && !loading_; }

  // Posts `on_idle` once every accepted request has been answered. Used to
  // drain at end of input before shutting down.
  void WhenIdle(std::function<void()> on_idle) {
    idle_waiter_ = std::move(on_idle);
    CheckIdle();
  }

  // Decodes one wire message and handles it; undecodable input is answered
  // with an error and changes nothing.
  void HandleMessage(std::string_view text) {
    auto request = protocol::ParseRequest(text);
    if (!request) {
      Reject(request.error().id, request.error().message);
      return;
    }
    Handle(std::move(*request));
  }

  void Handle(protocol::Request request) {
    std::visit(
        Overloaded{
            [&](protocol::InitRequest &) { OnInit(request.id); },
            [&](protocol::RunRequest &run) {
              OnRun(request.id, std::move(run));
            },
            [&](protocol::InstallRequest &install) {
              OnInstall(request.id, std::move(install));
            },
            [&](protocol::InterruptRequest &) { OnInterrupt(request.id); },
            [&](protocol::RestartRequest &) { OnRestart(request.id); },
        },
        request.command);
  }

  // Connection gone: nothing is delivered any more, the session is dropped.
  void Shutdown() {
    notify_ = nullptr;
    idle_waiter_ = nullptr;
    loading_ = false;
    supervisor_->Abort(kInterruptedMessage);
    if (session_) {
      session_->Terminate();
      session_.reset();
    }
  }

private:
  using RequestId = std::optional<protocol::RequestId>;

  void OnInit(RequestId id) {
    if (!session_) {
      session_ = make_session_();
    }
    switch (session_->State()) {
    case SessionState::uninitialized:
      BeginLoad(id);
      return;
    case SessionState::initializing:
    case SessionState::ready:
    case SessionState::executing:
      // already loading or loaded: no second load, no second notification
      return;
    case SessionState::terminated:
      Reject(id, "Cannot initialize: session was terminated (restart required)");
      return;
    }
  }

  void OnRestart(RequestId id) {
    SettleLoad();
    supervisor_->Abort(kInterruptedMessage);
    if (session_) {
      session_->Terminate();
    }
    session_ = make_session_();
    Log("restarting with session " + std::to_string(session_->Id()));
    BeginLoad(id);
  }

  void BeginLoad(RequestId id) {
    if (auto st = session_->Transition(SessionState::initializing); !st) {
      Reject(id, st.error().Message());
      return;
    }
    loading_ = true;
    loading_id_ = id;
    std::weak_ptr<Controller> weak = weak_from_this();
    std::weak_ptr<Session> loading = session_;
    session_->Dispatch<engine::OpResult>(
        [](engine::IInterpreter &interpreter) { return interpreter.Load(); },
        [weak, loading, id](engine::OpResult loaded) {
          if (auto self = weak.lock()) {
            self->OnLoaded(loading, id, std::move(loaded));
          }
        });
  }

  void OnLoaded(const std::weak_ptr<Session> &loading, RequestId id,
                engine::OpResult loaded) {
    auto session = loading.lock();
    // replaced or terminated while loading: SettleLoad already answered
    if (!session || session != session_ ||
        session->State() != SessionState::initializing) {
      return;
    }
    loading_ = false;
    if (!loaded) {
      (void)session->Transition(SessionState::uninitialized);
      Log("initialization failed: " + loaded.error());
      protocol::Response r;
      r.type = protocol::ResponseType::error;
      r.id = id;
      r.error = "Failed to initialize interpreter: " + loaded.error();
      Journal(logging::JournalRequest::init, logging::JournalOutcome::error);
      Emit(std::move(r));
      CheckIdle();
      return;
    }
    (void)session->Transition(SessionState::ready);
    Log("session " + std::to_string(session->Id()) + " ready");
    protocol::Response r;
    r.type = protocol::ResponseType::ready;
    r.id = id;
    Journal(logging::JournalRequest::init, logging::JournalOutcome::ready);
    Emit(std::move(r));
    CheckIdle();
  }

  // The load in flight will never be reported by OnLoaded (its session is
  // about to be terminated or replaced), so its init is answered here.
  void SettleLoad() {
    if (!loading_) {
      return;
    }
    loading_ = false;
    Log("initialization interrupted");
    protocol::Response r;
    r.type = protocol::ResponseType::error;
    r.id = loading_id_;
    r.error = kInitInterruptedMessage;
    Journal(logging::JournalRequest::init, logging::JournalOutcome::error);
    Emit(std::move(r));
  }

  // Guard shared by run and install: only a ready session accepts work.
  bool RequireReady(const RequestId &id, const char *what) {
    const SessionState state = State();
    if (state == SessionState::ready) {
      return true;
    }
    std::string message = std::string("Cannot ") + what + ": session is " +
                          ToString(state);
    if (state == SessionState::terminated) {
      message += " (restart required)";
    }
    Reject(id, message);
    return false;
  }

  void OnRun(RequestId id, protocol::RunRequest run) {
    if (!RequireReady(id, "run code")) {
      return;
    }
    const auto timeout = run.timeout.value_or(settings_.default_timeout);
    Supervisor::GuestJob job;
    if (run.IsProject()) {
      std::string entry = engine::SanitizePath(run.entry_point);
      if (entry.empty()) {
        protocol::Response r;
        r.type = protocol::ResponseType::error;
        r.id = id;
        r.error = "Invalid entry point path";
        r.execution_time_ms = 0.0;
        Emit(std::move(r));
        return;
      }
      job = [files = engine::SanitizeFiles(std::move(run.files)),
             entry = std::move(entry)](engine::IInterpreter &interpreter) {
        if (auto staged = interpreter.StageProject(files); !staged) {
          return staged;
        }
        return interpreter.ExecuteEntryPoint(entry);
      };
    } else {
      job = [code = std::move(run.code)](engine::IInterpreter &interpreter) {
        return interpreter.Execute(code);
      };
    }
    Supervise(id, logging::JournalRequest::run, std::move(job), timeout,
              nullptr);
  }

  void OnInstall(RequestId id, protocol::InstallRequest install) {
    if (!RequireReady(id, "install packages")) {
      return;
    }
    const std::string names = Join(install.packages);
    protocol::Response progress;
    progress.type = protocol::ResponseType::installing;
    progress.id = id;
    progress.output = "Installing packages: " + names + "...";
    Emit(std::move(progress));

    const auto timeout = install.timeout.value_or(settings_.install_timeout);
    Supervise(
        id, logging::JournalRequest::install,
        [packages = std::move(install.packages)](
            engine::IInterpreter &interpreter) {
          return interpreter.Install(packages);
        },
        timeout,
        [names](ExecutionResult &result) {
          if (result.outcome == Outcome::success) {
            result.output = "Successfully installed: " + names;
            result.out.reset();
            result.err.reset();
          }
        });
  }

  void OnInterrupt(RequestId id) {
    // a pending load or an in-flight run settles first
    SettleLoad();
    supervisor_->Abort(kInterruptedMessage);
    if (!session_) {
      session_ = make_session_();
    }
    session_->Terminate();
    Log("interrupt: session " + std::to_string(session_->Id()) +
        " terminated");
    protocol::Response r;
    r.type = protocol::ResponseType::interrupted;
    r.id = id;
    r.error = kRestartRequiredMessage;
    Journal(logging::JournalRequest::interrupt,
            logging::JournalOutcome::interrupted);
    Emit(std::move(r));
  }

  void Supervise(RequestId id, logging::JournalRequest kind,
                 Supervisor::GuestJob job, std::chrono::milliseconds timeout,
                 std::function<void(ExecutionResult &)> finish) {
    std::weak_ptr<Controller> weak = weak_from_this();
    auto started = supervisor_->Run(
        session_, std::move(job), timeout,
        [weak, id, kind, finish = std::move(finish)](ExecutionResult result) {
          auto self = weak.lock();
          if (!self) {
            return;
          }
          if (finish) {
            finish(result);
          }
          self->Report(id, kind, std::move(result));
        });
    if (!started) {
      Reject(id, started.error().Message());
    }
  }

  void Report(const RequestId &id, logging::JournalRequest kind,
              ExecutionResult result) {
    protocol::Response r;
    r.id = id;
    r.output = std::move(result.output);
    r.error = std::move(result.error);
    r.out = std::move(result.out);
    r.err = std::move(result.err);
    r.execution_time_ms = result.execution_time_ms;
    switch (result.outcome) {
    case Outcome::success:
      r.type = protocol::ResponseType::success;
      Journal(kind, logging::JournalOutcome::success,
              result.execution_time_ms);
      break;
    case Outcome::error:
      r.type = protocol::ResponseType::error;
      Journal(kind, logging::JournalOutcome::error, result.execution_time_ms);
      break;
    case Outcome::interrupted:
      r.type = protocol::ResponseType::interrupted;
      Log(std::string(logging::ToString(kind)) +
          " interrupted: " + r.error.value_or(""));
      Journal(kind, logging::JournalOutcome::interrupted,
              result.execution_time_ms);
      break;
    }
    Emit(std::move(r));
    CheckIdle();
  }

  // Protocol violation: answered synchronously, no state change.
  void Reject(const RequestId &id, std::string message) {
    protocol::Response r;
    r.type = protocol::ResponseType::error;
    r.id = id;
    r.error = std::move(message);
    Emit(std::move(r));
  }

  void Emit(protocol::Response response) {
    if (notify_) {
      notify_(std::move(response));
    }
  }

  void CheckIdle() {
    if (idle_waiter_ && Idle()) {
      net::post(host_, std::exchange(idle_waiter_, nullptr));
    }
  }

  void Journal(logging::JournalRequest kind, logging::JournalOutcome outcome,
               double execution_ms = -1.0) {
    if (!journal_) {
      return;
    }
    logging::JournalEvent ev{};
    ev.epoch_ms = timeutil::EpochMillisUtc();
    ev.session_id = session_ ? session_->Id() : 0;
    ev.controller = index_;
    ev.request = kind;
    ev.outcome = outcome;
    ev.execution_us =
        execution_ms < 0 ? -1 : std::llround(execution_ms * 1000.0);
    if (!journal_->push(ev)) {
      Log("journal queue full, event dropped");
    }
  }

  void Log(const std::string &message) const {
    logging::Console("controller " + std::to_string(index_), message);
  }

  static std::string Join(const std::vector<std::string> &items) {
    std::string out;
    for (const auto &item : items) {
      if (!out.empty()) {
        out += ", ";
      }
      out += item;
    }
    return out;
  }

  std::uint32_t index_;
  net::any_io_executor host_;
  SessionFactory make_session_;
  ControllerSettings settings_;
  Notify notify_;
  std::shared_ptr<logging::JournalQueue> journal_;
  std::shared_ptr<Supervisor> supervisor_;
  std::shared_ptr<Session> session_;
  bool loading_ = false;
  RequestId loading_id_;
  std::function<void()> idle_waiter_;
};
