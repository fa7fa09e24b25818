#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>

namespace URL {

inline constexpr const char *kDefaultListenPort = "8765";

struct ListenParts {
  std::string scheme; // "ws" or "wss"
  std::string host;
  std::string port;
};

// Parses ws://host[:port][/] or wss://host[:port][/]. A path other than "/"
// is rejected: the worker serves a single endpoint.
inline std::optional<ListenParts> ParseListenUrl(const std::string &url) {
  std::string scheme;
  std::string rest;
  if (boost::algorithm::istarts_with(url, "wss://")) {
    scheme = "wss";
    rest = url.substr(6);
  } else if (boost::algorithm::istarts_with(url, "ws://")) {
    scheme = "ws";
    rest = url.substr(5);
  } else {
    return std::nullopt;
  }
  auto slash = rest.find('/');
  if (slash != std::string::npos) {
    if (rest.substr(slash) != "/") {
      return std::nullopt;
    }
    rest = rest.substr(0, slash);
  }
  std::string host = rest;
  std::string port = kDefaultListenPort;
  auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    host = rest.substr(0, colon);
    port = rest.substr(colon + 1);
    std::uint16_t value = 0;
    auto [ptr, ec] =
        std::from_chars(port.data(), port.data() + port.size(), value);
    if (ec != std::errc() || ptr != port.data() + port.size()) {
      return std::nullopt;
    }
  }
  if (host.empty()) {
    return std::nullopt;
  }
  return ListenParts{.scheme = scheme, .host = host, .port = port};
}

} // namespace URL
