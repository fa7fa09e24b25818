#pragma once

#include <optional>
#include <string>

namespace capture {

inline constexpr const char *kNoOutputPlaceholder = "(no output)";

// CapturedOutput — snapshot of both guest streams for one run.
struct CapturedOutput {
  std::string out;
  std::string err;

  bool Empty() const { return out.empty() && err.empty(); }

  // stdout, then stderr after a newline when stderr is non-empty
  std::string Combined() const {
    if (err.empty()) {
      return out;
    }
    return out + "\n" + err;
  }

  // Result text of a successful run
  std::string CombinedOrPlaceholder() const {
    std::string text = Combined();
    if (text.empty()) {
      return kNoOutputPlaceholder;
    }
    return text;
  }

  // Partial output attached to a failed run, absent when nothing was written
  std::optional<std::string> CombinedIfAny() const {
    std::string text = Combined();
    if (text.empty()) {
      return std::nullopt;
    }
    return text;
  }
};

} // namespace capture
