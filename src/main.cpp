#include "config/options.hpp"
#include "core/runner.hpp"
#include "logging/console.hpp"
#include <csignal>
#include <iostream>
#include <string>

int main(int argc, char **argv) {
  auto opt = ParseArgs(argc, argv);
  if (!opt) {
    std::cerr << "codeworker: " << opt.error() << "\n" << Usage();
    return 2;
  }
  if (opt->show_help) {
    std::cout << Usage();
    return 0;
  }
  logging::SetConsoleEnabled(!opt->quiet);
  // a vanished client must surface as a write error, not kill the worker
  std::signal(SIGPIPE, SIG_IGN);

  logging::Console("main",
                   std::string("mode=") +
                       (opt->mode == RunMode::stdio ? "stdio" : opt->listen) +
                       " workdir=" + opt->workdir.string());
  return Run(*opt);
}
