#include "otto/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);
  return otto::cli::run_cli(argc, argv);
}
