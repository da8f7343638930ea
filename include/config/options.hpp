#ifndef CFS_CONFIG_OPTIONS_HPP
#define CFS_CONFIG_OPTIONS_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include "logger/logger.hpp"

namespace cfs {
namespace config {

// Interactive shell on stdin, or run until SIGINT/SIGTERM
enum class RunMode {
  SHELL,
  DAEMON
};

struct ProgramOptions {
  std::string snapshot_path;
  std::string log_file{"cfs.log"};
  logging::severity_level log_level{logging::severity_level::info};
  // Seconds between checkpoints, 0 disables autosave
  uint32_t autosave_seconds{30};
  // Tenant the shell starts in
  std::string tenant{"local"};
  RunMode mode{RunMode::SHELL};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out = std::cerr);

// Parses the command line. Errors are reported on err and leave valid == false.
ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err = std::cerr);

} // namespace config
} // namespace cfs

#endif // CFS_CONFIG_OPTIONS_HPP
