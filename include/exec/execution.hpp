#pragma once

#include "capture/captured_output.hpp"
#include <optional>
#include <string>

enum class Outcome { success, error, interrupted };

inline const char *ToString(Outcome o) {
  switch (o) {
  case Outcome::success:
    return "success";
  case Outcome::error:
    return "error";
  case Outcome::interrupted:
    return "interrupted";
  }
  return "unknown";
}

inline constexpr const char *kTimeoutMessage = "Execution timeout";
inline constexpr const char *kInterruptedMessage = "Execution interrupted";

// ExecutionResult — emitted exactly once per accepted request, never mutated
// afterwards. `out`/`err` are the raw guest streams; `output` is the combined
// text callers display.
struct ExecutionResult {
  Outcome outcome = Outcome::success;
  std::optional<std::string> output;
  std::optional<std::string> error;
  std::optional<std::string> out;
  std::optional<std::string> err;
  double execution_time_ms = 0.0;

  static ExecutionResult Success(const capture::CapturedOutput &captured,
                                 double elapsed_ms) {
    ExecutionResult r;
    r.outcome = Outcome::success;
    r.output = captured.CombinedOrPlaceholder();
    r.out = captured.out;
    r.err = captured.err;
    r.execution_time_ms = elapsed_ms;
    return r;
  }

  static ExecutionResult Error(std::string message,
                               const capture::CapturedOutput &captured,
                               double elapsed_ms) {
    ExecutionResult r;
    r.outcome = Outcome::error;
    r.error = std::move(message);
    r.output = captured.CombinedIfAny();
    r.out = captured.out;
    r.err = captured.err;
    r.execution_time_ms = elapsed_ms;
    return r;
  }

  static ExecutionResult Interrupted(std::string message, double elapsed_ms) {
    ExecutionResult r;
    r.outcome = Outcome::interrupted;
    r.error = std::move(message);
    r.execution_time_ms = elapsed_ms;
    return r;
  }
};
