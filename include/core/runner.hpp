#pragma once

#include "config/options.hpp"
#include "core/reactor.hpp"
#include "core/session.hpp"
#include "engine/python_interpreter.hpp"
#include "exec/controller.hpp"
#include "logging/console.hpp"
#include "logging/journal_logger.hpp"
#include "net/url.hpp"
#include "transport/stdio_channel.hpp"
#include "transport/ws_ops.hpp"
#include "transport/ws_server.hpp"
#include <atomic>
#include <csignal>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>

// Runner composition/threading overview:
// - Reactor: runs io_context on 1 thread; hosts controllers, supervisors,
//   deadline timers, the WebSocket coroutines and the signal set
// - Session: one guest jthread each, running its CPython sub-interpreter
// - StdioChannel (stdio mode): reader jthread posting lines to the reactor
// - WsServer (ws mode): accept loop coroutine, one controller per connection
// - JournalLogger (optional): background jthread draining journal events
// - Main thread: waits for SIGINT/SIGTERM or end of input, then stops the
//   transport on the reactor, drains it and joins
inline engine::PythonSettings SessionPythonSettings(const Options &opt,
                                                    std::uint64_t session_id) {
  return engine::PythonSettings{
      .project_root = opt.workdir / ("session-" + std::to_string(session_id)) /
                      "project",
      .packages_dir = opt.workdir / "site-packages",
  };
}

inline int Run(const Options &opt) {
  // Init
  std::shared_ptr<logging::JournalQueue> journal_queue;
  std::optional<logging::JournalLogger> journal;
  if (!opt.journal.empty()) {
    journal.emplace(opt.journal);
    if (!journal->OpenOk()) {
      logging::Console("runner", "cannot open journal " + opt.journal);
      return 1;
    }
    journal_queue = journal->Queue();
  }

  Reactor reactor;
  auto next_session = std::make_shared<std::atomic<std::uint64_t>>(1);
  auto host = reactor.GetExecutor();
  auto make_session = [&opt, host, next_session]() {
    const std::uint64_t id = next_session->fetch_add(1);
    return std::make_shared<Session>(
        id, host,
        std::make_shared<engine::PythonInterpreter>(
            SessionPythonSettings(opt, id)));
  };
  const ControllerSettings settings{.default_timeout = opt.default_timeout,
                                    .install_timeout = opt.install_timeout,
                                    .eager_init = opt.eager_init};

  std::promise<void> done;
  auto finished = done.get_future();
  auto once = std::make_shared<std::atomic<bool>>(false);
  auto finish = [&done, once] {
    if (!once->exchange(true)) {
      done.set_value();
    }
  };

  net::signal_set signals(reactor.GetIoContext(), SIGINT, SIGTERM);
  signals.async_wait([finish](const boost::system::error_code &ec, int sig) {
    if (!ec) {
      logging::Console("runner", "signal " + std::to_string(sig));
      finish();
    }
  });

  std::optional<StdioChannel> stdio;
  std::optional<WsServer> ws;
  if (opt.mode == RunMode::stdio) {
    stdio.emplace(host, STDIN_FILENO, STDOUT_FILENO);
  } else {
    auto url = URL::ParseListenUrl(opt.listen);
    if (!url) {
      logging::Console("runner", "invalid listen URL " + opt.listen);
      return 1;
    }
    std::optional<ssl::context> tls;
    if (url->scheme == "wss") {
      auto ctx = wsops::MakeServerTlsContext(opt.tls_cert, opt.tls_key);
      if (!ctx) {
        logging::Console("runner", "TLS setup failed: " + ctx.error().message());
        return 1;
      }
      tls.emplace(std::move(*ctx));
    }
    ws.emplace(
        reactor.GetIoContext(),
        [&make_session, settings, journal_queue, host](
            std::uint32_t index, Controller::Notify notify) {
          return std::make_shared<Controller>(index, host, make_session,
                                              settings, std::move(notify),
                                              journal_queue);
        },
        std::move(tls));
    if (auto st = ws->Start(url->host, url->port); !st) {
      logging::Console("runner", "listen failed: " + st.error().message());
      return 1;
    }
  }

  // Start
  if (journal.has_value()) {
    journal->Start();
  }
  reactor.Start();
  if (stdio.has_value()) {
    net::post(host, [&stdio, &make_session, settings, journal_queue, host,
                     finish] {
      stdio->Start(
          [&](Controller::Notify notify) {
            return std::make_shared<Controller>(0, host, make_session,
                                                settings, std::move(notify),
                                                journal_queue);
          },
          finish);
    });
  }

  // Wait for a signal or end of input
  finished.wait();

  // Stop: transports are torn down on the reactor thread
  std::promise<void> stopped;
  net::post(host, [&] {
    boost::system::error_code ec;
    signals.cancel(ec);
    if (stdio.has_value()) {
      stdio->Stop();
    }
    if (ws.has_value()) {
      ws->Stop();
    }
    stopped.set_value();
  });
  stopped.get_future().wait();
  reactor.Stop();
  reactor.Join();
  stdio.reset();
  ws.reset();
  if (journal.has_value()) {
    journal->Join();
  }
  return 0;
}
