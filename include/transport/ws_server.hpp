#pragma once

#include "exec/controller.hpp"
#include "logging/console.hpp"
#include "protocol/codec.hpp"
#include "transport/ws_ops.hpp"
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace net = boost::asio;
namespace ssl = net::ssl;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

inline constexpr const char *kServerName = "codeworker/0.1";

using ControllerFactory = std::function<std::shared_ptr<Controller>(
    std::uint32_t index, Controller::Notify notify)>;

// WsConnection
// Threading model:
// - Two Boost.Asio coroutines (spawn) on the reactor thread: a read loop that
//   feeds the controller, and a write loop that drains the outbox
// - The controller notifies from reactor handlers at any time; the outbox
//   timer wakes the writer so only one async_write is ever in flight
// - One connection is one worker instance: its own controller and session
template <typename WS>
class WsConnection : public std::enable_shared_from_this<WsConnection<WS>> {
public:
  static constexpr bool kTls =
      std::is_same_v<WS, websocket::stream<beast::ssl_stream<tcp::socket>>>;

  template <typename... Args>
  WsConnection(std::uint32_t index, net::io_context &ioc, Args &&...args)
      : index_(index), ioc_(ioc), ws_(std::forward<Args>(args)...),
        wake_(ioc) {}

  void Start(const ControllerFactory &make_controller) {
    std::weak_ptr<WsConnection> weak = this->weak_from_this();
    controller_ = make_controller(index_, [weak](protocol::Response r) {
      if (auto self = weak.lock()) {
        self->Push(protocol::Serialize(r));
      }
    });
    auto self = this->shared_from_this();
    net::spawn(ioc_, [self](net::yield_context yield) { self->Run(yield); });
  }

private:
  void Run(net::yield_context yield) {
    if constexpr (kTls) {
      if (auto st = wsops::AsyncTlsAccept(ws_.next_layer(), yield); !st) {
        OnError("tls handshake", st.error());
        return;
      }
    }
    wsops::ConfigureWebSocket(ws_, kServerName);
    if (auto st = wsops::AsyncWsAccept(ws_, yield); !st) {
      OnError("ws handshake", st.error());
      return;
    }
    Log("connected");

    auto self = this->shared_from_this();
    net::spawn(ioc_,
               [self](net::yield_context y) { self->WriteLoop(y); });
    controller_->Start();

    beast::error_code ec = ReadLoop(yield);
    if (ec != websocket::error::closed) {
      OnError("read", ec);
    }
    Log("disconnected");
    controller_->Shutdown();
    closed_ = true;
    wake_.cancel();
  }

  beast::error_code ReadLoop(net::yield_context yield) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    for (;;) {
      ws_.async_read(buffer, yield[ec]);
      if (ec) {
        return ec;
      }
      controller_->HandleMessage(beast::buffers_to_string(buffer.data()));
      buffer.consume(buffer.size());
    }
  }

  void WriteLoop(net::yield_context yield) {
    beast::error_code ec;
    for (;;) {
      while (!outbox_.empty() && !closed_) {
        ws_.async_write(net::buffer(outbox_.front()), yield[ec]);
        if (ec) {
          OnError("write", ec);
          closed_ = true;
          return;
        }
        outbox_.pop_front();
      }
      if (closed_) {
        return;
      }
      wake_.expires_at(net::steady_timer::time_point::max());
      wake_.async_wait(yield[ec]);
      // operation_aborted is the wake-up signal
    }
  }

  void Push(std::string text) {
    if (closed_) {
      return;
    }
    outbox_.push_back(std::move(text));
    wake_.cancel();
  }

  void OnError(const char *stage, const beast::error_code &ec) {
    Log(std::string(stage) + " error: " + ec.message());
  }

  void Log(const std::string &message) const {
    logging::Console("ws_connection " + std::to_string(index_), message);
  }

  std::uint32_t index_;
  net::io_context &ioc_;
  WS ws_;
  net::steady_timer wake_;
  std::deque<std::string> outbox_;
  bool closed_ = false;
  std::shared_ptr<Controller> controller_;
};

// WsServer
// Threading model:
// - The accept loop is a coroutine on the reactor thread; every accepted
//   socket becomes a WsConnection on the same thread
// - With a TLS context the server speaks wss, otherwise plain ws
class WsServer {
public:
  WsServer(net::io_context &ioc, ControllerFactory make_controller,
           std::optional<ssl::context> tls = std::nullopt)
      : ioc_(ioc), acceptor_(ioc), make_controller_(std::move(make_controller)),
        tls_(std::move(tls)) {}

  wsops::Status Start(const std::string &host, const std::string &port) {
    auto endpoint = wsops::Resolve(ioc_, host, port);
    if (!endpoint) {
      return std::unexpected(endpoint.error());
    }
    if (auto st = wsops::Listen(acceptor_, *endpoint); !st) {
      return st;
    }
    logging::Console("ws_server", std::string("listening on ") +
                                      (tls_ ? "wss://" : "ws://") + host +
                                      ":" + port);
    net::spawn(ioc_, [this](net::yield_context yield) { AcceptLoop(yield); });
    return {};
  }

  // Bound address; resolves port 0 to the one the OS picked.
  tcp::endpoint LocalEndpoint() const {
    beast::error_code ec;
    return acceptor_.local_endpoint(ec);
  }

  // Must run on the reactor thread.
  void Stop() {
    beast::error_code ec;
    acceptor_.close(ec);
    if (ec) {
      logging::Console("ws_server", "close error: " + ec.message());
    }
  }

private:
  void AcceptLoop(net::yield_context yield) {
    for (;;) {
      tcp::socket socket(ioc_);
      beast::error_code ec;
      acceptor_.async_accept(socket, yield[ec]);
      if (ec) {
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
          return;
        }
        logging::Console("ws_server", "accept error: " + ec.message());
        continue;
      }
      wsops::SetTcpNoDelay(socket);
      const std::uint32_t index = next_index_++;
      if (tls_) {
        using Stream = websocket::stream<beast::ssl_stream<tcp::socket>>;
        std::make_shared<WsConnection<Stream>>(index, ioc_, std::move(socket),
                                               *tls_)
            ->Start(make_controller_);
      } else {
        using Stream = websocket::stream<tcp::socket>;
        std::make_shared<WsConnection<Stream>>(index, ioc_, std::move(socket))
            ->Start(make_controller_);
      }
    }
  }

  net::io_context &ioc_;
  tcp::acceptor acceptor_;
  ControllerFactory make_controller_;
  std::optional<ssl::context> tls_;
  std::uint32_t next_index_ = 1;
};
