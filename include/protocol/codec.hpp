#pragma once

#include "protocol/messages.hpp"
#include <expected>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

// namespace protocol — JSON wire form of the worker messages.
//   {"type":"run","id":7,"code":"print('hi')","timeout":5000}
//   {"type":"success","id":7,"output":"hi\n","stdout":"hi\n","stderr":"",
//    "executionTime":3.2}
namespace protocol {

using json = nlohmann::json;

namespace detail {

inline std::expected<std::optional<RequestId>, std::string>
ReadId(const json &j) {
  auto it = j.find("id");
  if (it == j.end() || it->is_null()) {
    return std::optional<RequestId>{};
  }
  if (it->is_number_integer()) {
    return std::optional<RequestId>{RequestId{it->get<std::int64_t>()}};
  }
  if (it->is_string()) {
    return std::optional<RequestId>{RequestId{it->get<std::string>()}};
  }
  return std::unexpected("id must be a string or an integer");
}

inline std::expected<std::optional<std::chrono::milliseconds>, std::string>
ReadTimeout(const json &j) {
  auto it = j.find("timeout");
  if (it == j.end() || it->is_null()) {
    return std::optional<std::chrono::milliseconds>{};
  }
  if (it->is_number_unsigned()) {
    // saturates past the representable range
    const auto ms = it->get<std::uint64_t>();
    if (ms == 0) {
      return std::unexpected("timeout must be a positive integer (milliseconds)");
    }
    constexpr auto kMax = std::chrono::milliseconds::max().count();
    return std::optional<std::chrono::milliseconds>{std::chrono::milliseconds(
        ms > static_cast<std::uint64_t>(kMax) ? kMax
                                               : static_cast<std::int64_t>(ms))};
  }
  if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
    return std::unexpected("timeout must be a positive integer (milliseconds)");
  }
  return std::optional<std::chrono::milliseconds>{
      std::chrono::milliseconds(it->get<std::int64_t>())};
}

inline std::expected<RunRequest, std::string> ReadRun(const json &j) {
  RunRequest run;
  auto timeout = ReadTimeout(j);
  if (!timeout) {
    return std::unexpected(timeout.error());
  }
  run.timeout = *timeout;

  if (auto files = j.find("files"); files != j.end() && !files->is_null()) {
    if (!files->is_array()) {
      return std::unexpected("files must be an array");
    }
    for (const auto &f : *files) {
      if (!f.is_object() || !f.contains("path") || !f["path"].is_string() ||
          !f.contains("content") || !f["content"].is_string()) {
        return std::unexpected(
            "each file needs a string path and a string content");
      }
      run.files.push_back(engine::SourceFile{f["path"].get<std::string>(),
                                             f["content"].get<std::string>()});
    }
  }
  if (run.IsProject()) {
    auto entry = j.find("entryPoint");
    if (entry == j.end() || !entry->is_string()) {
      return std::unexpected("entryPoint is required with files");
    }
    run.entry_point = entry->get<std::string>();
    return run;
  }
  auto code = j.find("code");
  if (code == j.end() || !code->is_string()) {
    return std::unexpected("code is required for run");
  }
  run.code = code->get<std::string>();
  return run;
}

inline std::expected<InstallRequest, std::string> ReadInstall(const json &j) {
  InstallRequest install;
  auto timeout = ReadTimeout(j);
  if (!timeout) {
    return std::unexpected(timeout.error());
  }
  install.timeout = *timeout;
  auto packages = j.find("packages");
  if (packages == j.end() || !packages->is_array() || packages->empty()) {
    return std::unexpected("packages must be a non-empty array");
  }
  for (const auto &p : *packages) {
    if (!p.is_string() || p.get<std::string>().empty()) {
      return std::unexpected("package names must be non-empty strings");
    }
    install.packages.push_back(p.get<std::string>());
  }
  return install;
}

} // namespace detail

inline std::expected<Request, ProtocolError> ParseRequest(std::string_view text) {
  json j = json::parse(text.begin(), text.end(), nullptr, false);
  if (j.is_discarded()) {
    return std::unexpected(ProtocolError{"Malformed message: invalid JSON", {}});
  }
  if (!j.is_object()) {
    return std::unexpected(
        ProtocolError{"Malformed message: expected a JSON object", {}});
  }
  auto id = detail::ReadId(j);
  if (!id) {
    return std::unexpected(ProtocolError{"Malformed message: " + id.error(), {}});
  }
  auto fail = [&](const std::string &why) {
    return std::unexpected(ProtocolError{"Malformed message: " + why, *id});
  };

  auto type = j.find("type");
  if (type == j.end() || !type->is_string()) {
    return fail("type is required");
  }
  const std::string kind = type->get<std::string>();
  Request request;
  request.id = *id;
  if (kind == "init") {
    request.command = InitRequest{};
  } else if (kind == "run") {
    auto run = detail::ReadRun(j);
    if (!run) {
      return fail(run.error());
    }
    request.command = std::move(*run);
  } else if (kind == "install") {
    auto install = detail::ReadInstall(j);
    if (!install) {
      return fail(install.error());
    }
    request.command = std::move(*install);
  } else if (kind == "interrupt") {
    request.command = InterruptRequest{};
  } else if (kind == "restart") {
    request.command = RestartRequest{};
  } else {
    return std::unexpected(
        ProtocolError{"Unknown message type: " + kind, *id});
  }
  return request;
}

inline json ToJson(const Response &r) {
  json j = json::object();
  j["type"] = ToString(r.type);
  if (r.id) {
    std::visit([&](const auto &v) { j["id"] = v; }, *r.id);
  }
  if (r.output) {
    j["output"] = *r.output;
  }
  if (r.out) {
    j["stdout"] = *r.out;
  }
  if (r.err) {
    j["stderr"] = *r.err;
  }
  if (r.error) {
    j["error"] = *r.error;
  }
  if (r.execution_time_ms) {
    j["executionTime"] = *r.execution_time_ms;
  }
  return j;
}

// Single line: guest text with newlines is escaped by the JSON encoder, so
// the result is safe for newline-delimited transports. Invalid UTF-8 from the
// guest is replaced rather than thrown on.
inline std::string Serialize(const Response &r) {
  return ToJson(r).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace protocol
