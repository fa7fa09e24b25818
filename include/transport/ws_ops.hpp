#pragma once

#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <expected>
#include <string>

namespace wsops {

namespace net = boost::asio;
namespace ssl = net::ssl;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

using Status = std::expected<void, beast::error_code>;

inline Status MakeStatus(const beast::error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

inline std::expected<tcp::endpoint, beast::error_code>
Resolve(net::io_context &ioc, const std::string &host,
        const std::string &port) {
  tcp::resolver resolver(ioc);
  beast::error_code ec;
  auto results = resolver.resolve(host, port, tcp::resolver::passive, ec);
  if (ec) {
    return std::unexpected(ec);
  }
  if (results.empty()) {
    return std::unexpected(
        beast::error_code(net::error::host_not_found, net::error::get_netdb_category()));
  }
  return results.begin()->endpoint();
}

inline Status Listen(tcp::acceptor &acceptor, const tcp::endpoint &endpoint) {
  beast::error_code ec;
  acceptor.open(endpoint.protocol(), ec);
  if (ec) {
    return std::unexpected(ec);
  }
  acceptor.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) {
    return std::unexpected(ec);
  }
  acceptor.bind(endpoint, ec);
  if (ec) {
    return std::unexpected(ec);
  }
  acceptor.listen(net::socket_base::max_listen_connections, ec);
  return MakeStatus(ec);
}

inline std::expected<ssl::context, beast::error_code>
MakeServerTlsContext(const std::string &cert_chain_file,
                     const std::string &private_key_file) {
  ssl::context ctx(ssl::context::tls_server);
  beast::error_code ec;
  ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                      ssl::context::no_sslv3,
                  ec);
  if (ec) {
    return std::unexpected(ec);
  }
  ctx.use_certificate_chain_file(cert_chain_file, ec);
  if (ec) {
    return std::unexpected(ec);
  }
  ctx.use_private_key_file(private_key_file, ssl::context::pem, ec);
  if (ec) {
    return std::unexpected(ec);
  }
  return ctx;
}

inline Status AsyncTlsAccept(beast::ssl_stream<tcp::socket> &stream,
                             net::yield_context yield) {
  beast::error_code ec;
  stream.async_handshake(ssl::stream_base::server, yield[ec]);
  return MakeStatus(ec);
}

template <typename WS>
inline Status AsyncWsAccept(WS &ws, net::yield_context yield) {
  beast::error_code ec;
  ws.async_accept(yield[ec]);
  return MakeStatus(ec);
}

inline void SetTcpNoDelay(tcp::socket &sock) {
  beast::error_code ec;
  sock.set_option(net::ip::tcp::no_delay(true), ec);
  (void)ec; // latency hint only
}

template <typename WS>
inline void ConfigureWebSocket(WS &ws, const std::string &serverName) {
  websocket::permessage_deflate pmd;
  pmd.client_enable = false;
  pmd.server_enable = false;
  ws.set_option(pmd);
  ws.set_option(websocket::stream_base::timeout::suggested(
      beast::role_type::server));
  ws.set_option(websocket::stream_base::decorator(
      [serverName](websocket::response_type &res) {
        res.set(beast::http::field::server, serverName);
      }));
  ws.text(true);
}

} // namespace wsops
