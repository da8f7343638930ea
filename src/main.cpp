#include "app/bootstrap.hpp"
#include "cli/cli.hpp"
#include "config/options.hpp"
#include "logger/logger.hpp"
#include <chrono>
#include <iostream>
#include <string>

bool run_store(const cfs::config::ProgramOptions& options) {
  try {
    cfs::app::Bootstrap node(options.snapshot_path,
                             std::chrono::seconds(options.autosave_seconds));

    if (!node.start()) {
      std::cerr << "Error: Failed to start store, see " << options.log_file << '\n';
      return false;
    }

    if (options.mode == cfs::config::RunMode::SHELL) {
      cfs::cli::CLI cli(node.get_file_service(), options.snapshot_path, options.tenant);
      cli.set_stop_predicate([&node]() { return node.stop_requested(); });
      cli.run();
    } else {
      std::cout << "Store running, send SIGINT or SIGTERM to stop" << std::endl;
      node.wait_for_stop();
    }

    if (!node.shutdown()) {
      std::cerr << "Error: Final snapshot was not written\n";
      return false;
    }
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = cfs::config::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    cfs::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception&) {
    return 1;
  }

  return run_store(options) ? 0 : 1;
}
