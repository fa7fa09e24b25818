#pragma once

#include "capture/captured_output.hpp"
#include "capture/output_capture.hpp"
#include "engine/interpreter.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace engine {

struct PythonSettings {
  // Replaced on every multi-file run.
  std::filesystem::path project_root;
  // pip --target directory; shared by all sessions of a worker.
  std::filesystem::path packages_dir;
};

class PythonInterpreter;

// Redirects the session's sys.stdout/sys.stderr into in-memory buffers.
class PythonOutput : public capture::ICaptureBuffer {
public:
  explicit PythonOutput(PythonInterpreter &owner) : owner_(owner) {}

  void Clear() override;
  void Capture() override;
  void Release() override;
  capture::CapturedOutput Read() override;

private:
  PythonInterpreter &owner_;
};

// PythonInterpreter
// Threading model:
// - One CPython sub-interpreter per instance (own sys, sys.modules,
//   __main__), created by Load() on the calling thread. Every later call,
//   and destruction, must happen on that same thread (the session's guest
//   thread)
// - Calls hold the GIL only while they run; sub-interpreters share it, so a
//   runaway guest in one session slows others but does not stop them
// - Destroyed on a foreign thread (guest thread abandoned and torn down
//   elsewhere), the sub-interpreter is leaked rather than ended
class PythonInterpreter : public IInterpreter {
public:
  explicit PythonInterpreter(PythonSettings settings);
  ~PythonInterpreter() override;

  PythonInterpreter(const PythonInterpreter &) = delete;
  PythonInterpreter &operator=(const PythonInterpreter &) = delete;

  OpResult Load() override;
  capture::ICaptureBuffer &Output() override { return output_; }
  OpResult Execute(const std::string &code) override;
  OpResult StageProject(const std::vector<SourceFile> &files) override;
  OpResult ExecuteEntryPoint(const std::string &entry_point) override;
  OpResult Install(const std::vector<std::string> &packages) override;

  const PythonSettings &Settings() const { return settings_; }

private:
  friend class PythonOutput;
  struct State;

  // Calls one bootstrap helper with the GIL held; a non-None return is the
  // guest error text.
  template <typename... Args>
  OpResult CallTool(const char *name, Args &&...args);

  void Unload();

  PythonSettings settings_;
  std::thread::id owner_;
  std::unique_ptr<State> state_;
  PythonOutput output_;
};

} // namespace engine
