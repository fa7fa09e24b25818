#pragma once

#include "engine/interpreter.hpp"
#include <string>
#include <string_view>
#include <vector>

// namespace engine — path hygiene for multi-file projects. Every path coming
// from a caller is reduced to a relative path below the project root.
namespace engine {

// Drops "..", "." and empty segments; the result never starts with '/'.
inline std::string SanitizePath(std::string_view path) {
  std::string out;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    std::size_t slash = path.find('/', pos);
    if (slash == std::string_view::npos) {
      slash = path.size();
    }
    std::string_view segment = path.substr(pos, slash - pos);
    if (!segment.empty() && segment != "." && segment != "..") {
      if (!out.empty()) {
        out.push_back('/');
      }
      out.append(segment);
    }
    pos = slash + 1;
  }
  return out;
}

// Sanitizes every path and discards files whose path becomes empty.
inline std::vector<SourceFile> SanitizeFiles(std::vector<SourceFile> files) {
  std::vector<SourceFile> out;
  out.reserve(files.size());
  for (auto &file : files) {
    std::string path = SanitizePath(file.path);
    if (path.empty()) {
      continue;
    }
    out.push_back(SourceFile{std::move(path), std::move(file.content)});
  }
  return out;
}

// Project subdirectories put on the import path when they exist.
inline const std::vector<std::string> &ProjectSearchDirs() {
  static const std::vector<std::string> dirs{"src", "lib", "utils"};
  return dirs;
}

} // namespace engine
