#pragma once

#include "net/url.hpp"
#include <charconv>
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unistd.h>

enum class RunMode { stdio, ws };

struct Options {
  RunMode mode = RunMode::stdio;
  std::string listen = "ws://127.0.0.1:8765";
  std::string tls_cert;
  std::string tls_key;
  std::chrono::milliseconds default_timeout{30000};
  std::chrono::milliseconds install_timeout{120000};
  std::filesystem::path workdir;
  std::string journal;
  bool eager_init = true;
  bool quiet = false;
  bool show_help = false;
};

inline const char *Usage() {
  return "usage: codeworker [options]\n"
         "  -m, --mode stdio|ws          transport (default stdio)\n"
         "  -l, --listen URL             ws://host:port or wss://host:port\n"
         "      --tls-cert FILE          certificate chain (PEM) for wss\n"
         "      --tls-key FILE           private key (PEM) for wss\n"
         "  -t, --default-timeout-ms N   run deadline when none is given "
         "(30000)\n"
         "      --install-timeout-ms N   install deadline (120000)\n"
         "  -w, --workdir DIR            project and package directory\n"
         "  -j, --journal FILE           append one line per finished request\n"
         "      --no-eager-init          wait for an init request\n"
         "  -q, --quiet                  no diagnostics on stderr\n"
         "  -h, --help                   show this text\n";
}

namespace detail {

inline std::expected<std::chrono::milliseconds, std::string>
ParseMillis(std::string_view flag, std::string_view value) {
  long long v = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v);
  if (ec != std::errc() || ptr != value.data() + value.size() || v <= 0) {
    return std::unexpected(std::string(flag) +
                           " expects a positive integer, got '" +
                           std::string(value) + "'");
  }
  return std::chrono::milliseconds(v);
}

} // namespace detail

inline std::filesystem::path DefaultWorkdir() {
  std::error_code ec;
  std::filesystem::path base = std::filesystem::temp_directory_path(ec);
  if (ec) {
    base = "/tmp";
  }
  return base / ("codeworker-" + std::to_string(::getpid()));
}

inline std::expected<Options, std::string> ParseArgs(int argc, char **argv) {
  Options opt;
  auto value = [&](int &i, std::string_view flag)
      -> std::expected<std::string, std::string> {
    if (i + 1 >= argc) {
      return std::unexpected(std::string(flag) + " needs a value");
    }
    return std::string(argv[++i]);
  };
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "-h" || a == "--help") {
      opt.show_help = true;
    } else if (a == "-m" || a == "--mode") {
      auto v = value(i, a);
      if (!v) {
        return std::unexpected(v.error());
      }
      if (*v == "stdio") {
        opt.mode = RunMode::stdio;
      } else if (*v == "ws") {
        opt.mode = RunMode::ws;
      } else {
        return std::unexpected("unknown mode '" + *v + "'");
      }
    } else if (a == "-l" || a == "--listen") {
      auto v = value(i, a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.listen = *v;
    } else if (a == "--tls-cert") {
      auto v = value(i, a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.tls_cert = *v;
    } else if (a == "--tls-key") {
      auto v = value(i, a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.tls_key = *v;
    } else if (a == "-t" || a == "--default-timeout-ms" ||
               a == "--install-timeout-ms") {
      auto v = value(i, a);
      if (!v) {
        return std::unexpected(v.error());
      }
      auto ms = detail::ParseMillis(a, *v);
      if (!ms) {
        return std::unexpected(ms.error());
      }
      (a == "--install-timeout-ms" ? opt.install_timeout
                                   : opt.default_timeout) = *ms;
    } else if (a == "-w" || a == "--workdir") {
      auto v = value(i, a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.workdir = *v;
    } else if (a == "-j" || a == "--journal") {
      auto v = value(i, a);
      if (!v) {
        return std::unexpected(v.error());
      }
      opt.journal = *v;
    } else if (a == "--no-eager-init") {
      opt.eager_init = false;
    } else if (a == "-q" || a == "--quiet") {
      opt.quiet = true;
    } else {
      return std::unexpected("unknown option '" + std::string(a) + "'");
    }
  }

  if (opt.mode == RunMode::ws) {
    auto url = URL::ParseListenUrl(opt.listen);
    if (!url) {
      return std::unexpected("invalid listen URL '" + opt.listen +
                             "' (expected ws://host:port or wss://host:port)");
    }
    const bool has_tls = !opt.tls_cert.empty() || !opt.tls_key.empty();
    if (url->scheme == "wss" && (opt.tls_cert.empty() || opt.tls_key.empty())) {
      return std::unexpected("wss needs both --tls-cert and --tls-key");
    }
    if (url->scheme == "ws" && has_tls) {
      return std::unexpected("--tls-cert/--tls-key need a wss:// listen URL");
    }
  }
  if (opt.workdir.empty()) {
    opt.workdir = DefaultWorkdir();
  }
  return opt;
}
