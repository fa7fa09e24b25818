#pragma once

#include "capture/output_capture.hpp"
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace engine {

struct SourceFile {
  std::string path;
  std::string content;
};

// Error text is what the caller sees: a loading failure message or the
// formatted guest exception.
using OpResult = std::expected<void, std::string>;

// IInterpreter — one guest interpreter environment.
// Threading model:
// - Not thread-safe. A Session posts every call to its GuestThread, so an
//   instance only ever runs on one OS thread, and is destroyed there too.
// - Execute() blocks until the guest code returns; nothing can unwind it from
//   outside. Callers that need a deadline race it (see Supervisor).
class IInterpreter {
public:
  virtual ~IInterpreter() = default;

  // Prepares the environment. A failed Load leaves the instance unloaded and
  // may be retried.
  virtual OpResult Load() = 0;

  virtual capture::ICaptureBuffer &Output() = 0;

  // Runs source in the session's persistent __main__ namespace.
  virtual OpResult Execute(const std::string &code) = 0;

  // Replaces the session's project directory with the given files (paths
  // already sanitized) and makes it importable.
  virtual OpResult StageProject(const std::vector<SourceFile> &files) = 0;

  // Runs a staged project file as __main__.
  virtual OpResult ExecuteEntryPoint(const std::string &entry_point) = 0;

  virtual OpResult Install(const std::vector<std::string> &packages) = 0;
};

using InterpreterFactory =
    std::function<std::shared_ptr<IInterpreter>(std::uint64_t session_id)>;

} // namespace engine
