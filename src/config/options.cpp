#include "config/options.hpp"
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace cfs {
namespace config {

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " -s <snapshot file> [options]\n"
      << "Required arguments:\n"
      << "  -s, --snapshot   Snapshot file loaded at start and written on shutdown\n"
      << "Optional arguments:\n"
      << "  -l, --log        Log file (default: cfs.log)\n"
      << "  -v, --log-level  trace, debug, info, warning, error or fatal (default: info)\n"
      << "  -a, --autosave   Seconds between checkpoints, 0 disables (default: 30)\n"
      << "  -t, --tenant     Tenant used by the shell at startup (default: local)\n"
      << "  -m, --mode       shell or daemon (default: shell)\n"
      << "Example: " << program_name << " -s data/store.snap -a 60 -t alice\n";
}

ProgramOptions parse_command_line(int argc, char* argv[], std::ostream& err) {
  const std::unordered_set<std::string> known_flags = {
    "-s", "--snapshot",
    "-l", "--log",
    "-v", "--log-level",
    "-a", "--autosave",
    "-t", "--tenant",
    "-m", "--mode"
  };

  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "cfs";

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);

    if (known_flags.count(flag) == 0) {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }

    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    const std::string value(argv[i + 1]);

    if (flag == "-s" || flag == "--snapshot") {
      options.snapshot_path = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-v" || flag == "--log-level") {
      auto level = logging::parse_severity(value);
      if (!level) {
        err << "Error: Invalid log level: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
      options.log_level = *level;
    } else if (flag == "-a" || flag == "--autosave") {
      try {
        std::size_t consumed = 0;
        const unsigned long seconds = std::stoul(value, &consumed);
        if (consumed != value.size() || value[0] == '-' ||
            seconds > std::numeric_limits<uint32_t>::max()) {
          throw std::out_of_range(value);
        }
        options.autosave_seconds = static_cast<uint32_t>(seconds);
      } catch (const std::exception&) {
        err << "Error: Invalid autosave interval: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
    } else if (flag == "-t" || flag == "--tenant") {
      options.tenant = value;
    } else if (flag == "-m" || flag == "--mode") {
      if (value == "shell") {
        options.mode = RunMode::SHELL;
      } else if (value == "daemon") {
        options.mode = RunMode::DAEMON;
      } else {
        err << "Error: Invalid mode: " << value << '\n';
        print_usage(program_name, err);
        return options;
      }
    }
  }

  if (options.snapshot_path.empty()) {
    err << "Error: A snapshot file is required\n";
    print_usage(program_name, err);
    return options;
  }

  if (options.tenant.empty()) {
    err << "Error: Tenant must not be empty\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace cfs
