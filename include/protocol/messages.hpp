#pragma once

#include "engine/interpreter.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// namespace protocol — typed worker messages. Requests are a closed sum type
// matched exhaustively by the Controller; responses carry one ResponseType
// plus the optional fields that type allows.
namespace protocol {

// Echoed back verbatim so callers can pair responses with requests.
using RequestId = std::variant<std::int64_t, std::string>;

struct InitRequest {};

struct RunRequest {
  std::string code;
  // multi-file form: files + entry point instead of code
  std::vector<engine::SourceFile> files;
  std::string entry_point;
  std::optional<std::chrono::milliseconds> timeout;

  bool IsProject() const { return !files.empty(); }
};

struct InstallRequest {
  std::vector<std::string> packages;
  std::optional<std::chrono::milliseconds> timeout;
};

struct InterruptRequest {};

struct RestartRequest {};

using Command = std::variant<InitRequest, RunRequest, InstallRequest,
                             InterruptRequest, RestartRequest>;

struct Request {
  Command command;
  std::optional<RequestId> id;
};

// A request that could not be decoded. `id` is filled when the payload got
// far enough to carry one.
struct ProtocolError {
  std::string message;
  std::optional<RequestId> id;
};

enum class ResponseType { ready, success, error, interrupted, installing };

inline const char *ToString(ResponseType t) {
  switch (t) {
  case ResponseType::ready:
    return "ready";
  case ResponseType::success:
    return "success";
  case ResponseType::error:
    return "error";
  case ResponseType::interrupted:
    return "interrupted";
  case ResponseType::installing:
    return "installing";
  }
  return "error";
}

struct Response {
  ResponseType type = ResponseType::error;
  std::optional<RequestId> id;
  std::optional<std::string> output;
  std::optional<std::string> out;
  std::optional<std::string> err;
  std::optional<std::string> error;
  std::optional<double> execution_time_ms;
};

} // namespace protocol
