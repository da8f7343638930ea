#include "cli/cli.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace cfs {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(service::FileService& file_service, const std::filesystem::path& snapshot_path,
         const store::TenantId& tenant, std::istream& in, std::ostream& out)
  : running_(false)
  , tenant_(tenant)
  , snapshot_path_(snapshot_path)
  , file_service_(file_service)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized for tenant: " << tenant_;
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "CFS_Shell[" << tenant_ << "]> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    if (stop_predicate_ && stop_predicate_()) {
      out_ << "Shutdown requested" << std::endl;
      break;
    }

    std::istringstream iss(line);
    std::string command;
    std::vector<std::string> args;

    iss >> command;
    for (std::string arg; iss >> arg;) {
      args.push_back(arg);
    }

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      out_ << "CFS_Shell[" << tenant_ << "]> " << std::flush;
    }
  }

  running_ = false;
  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  try {
    if (command == "help" && args.empty()) {
      handle_help_command();
    }
    else if (command == "whoami" && args.empty()) {
      out_ << tenant_ << std::endl;
    }
    else if (command == "tenant") {
      handle_tenant_command(args);
    }
    else if (command == "ls" && args.empty()) {
      handle_list_command();
    }
    else if (command == "exists") {
      handle_exists_command(args);
    }
    else if (command == "upload") {
      handle_upload_command(args);
    }
    else if (command == "put") {
      handle_put_command(args);
    }
    else if (command == "chunks") {
      handle_chunks_command(args);
    }
    else if (command == "get") {
      handle_get_command(args);
    }
    else if (command == "fetch") {
      handle_fetch_command(args);
    }
    else if (command == "type") {
      handle_type_command(args);
    }
    else if (command == "delete") {
      handle_delete_command(args);
    }
    else if (command == "save" && args.empty()) {
      handle_save_command();
    }
    else {
      out_ << "Unknown command or invalid arguments. Type 'help' for usage." << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error running " + command, e.what());
  }
}

void CLI::handle_tenant_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    out_ << "Usage: tenant <id>" << std::endl;
    return;
  }
  tenant_ = args[0];
  BOOST_LOG_TRIVIAL(info) << "CLI switched to tenant: " << tenant_;
  out_ << "Now acting as " << tenant_ << std::endl;
}

void CLI::handle_list_command() {
  const auto files = file_service_.get_files(tenant_);
  if (files.empty()) {
    out_ << "No files" << std::endl;
    return;
  }
  for (const auto& file : files) {
    out_ << "  " << file.name << "  " << file.size << " bytes  " << file.file_type << std::endl;
  }
}

void CLI::handle_exists_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    out_ << "Usage: exists <name>" << std::endl;
    return;
  }
  out_ << (file_service_.check_file_exists(tenant_, args[0]) ? "yes" : "no") << std::endl;
}

void CLI::handle_upload_command(const std::vector<std::string>& args) {
  if (args.size() != 4) {
    out_ << "Usage: upload <local file> <name> <index> <type>" << std::endl;
    return;
  }

  const uint64_t index = parse_index(args[2]);
  auto payload = read_local_file(args[0]);
  const std::size_t size = payload.size();
  if (!file_service_.upload_file_chunk(tenant_, args[1], std::move(payload), index, args[3])) {
    out_ << "Chunk " << index << " of " << args[1] << " already stored, upload discarded" << std::endl;
    return;
  }
  out_ << "Uploaded chunk " << index << " of " << args[1] << " (" << size << " bytes)" << std::endl;
}

void CLI::handle_put_command(const std::vector<std::string>& args) {
  if (args.size() != 3) {
    out_ << "Usage: put <local file> <name> <type>" << std::endl;
    return;
  }

  // Chunks of an existing file would be discarded as duplicates
  if (file_service_.check_file_exists(tenant_, args[1])) {
    out_ << "File " << args[1] << " already exists, delete it first" << std::endl;
    return;
  }

  const auto content = read_local_file(args[0]);

  // Split into fixed-size chunks indexed from 0; an empty file is one empty chunk
  uint64_t index = 0;
  uint64_t discarded = 0;
  std::size_t offset = 0;
  do {
    const std::size_t length = std::min(DEFAULT_CHUNK_SIZE, content.size() - offset);
    std::vector<uint8_t> payload(content.begin() + offset, content.begin() + offset + length);
    if (!file_service_.upload_file_chunk(tenant_, args[1], std::move(payload), index, args[2])) {
      ++discarded;
    }
    offset += length;
    ++index;
  } while (offset < content.size());

  // Another writer created the file between the check and the upload
  if (discarded > 0) {
    out_ << "Stored " << args[1] << " partially: " << discarded << " of " << index
         << " chunks were already present and discarded" << std::endl;
    return;
  }

  out_ << "Stored " << args[1] << " as " << index << " chunks (" << content.size() << " bytes)" << std::endl;
}

void CLI::handle_chunks_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    out_ << "Usage: chunks <name>" << std::endl;
    return;
  }
  out_ << file_service_.get_total_chunks(tenant_, args[0]) << std::endl;
}

void CLI::handle_get_command(const std::vector<std::string>& args) {
  if (args.size() != 2 && args.size() != 3) {
    out_ << "Usage: get <name> <index> [local file]" << std::endl;
    return;
  }

  const uint64_t index = parse_index(args[1]);
  const auto payload = file_service_.get_file_chunk(tenant_, args[0], index);
  if (!payload) {
    out_ << "No chunk " << index << " in " << args[0] << std::endl;
    return;
  }

  if (args.size() == 3) {
    write_local_file(args[2], *payload);
    out_ << "Wrote " << payload->size() << " bytes to " << args[2] << std::endl;
  } else {
    out_.write(reinterpret_cast<const char*>(payload->data()), payload->size());
    out_ << std::endl;
  }
}

void CLI::handle_fetch_command(const std::vector<std::string>& args) {
  if (args.size() != 2) {
    out_ << "Usage: fetch <name> <local file>" << std::endl;
    return;
  }

  const uint64_t total = file_service_.get_total_chunks(tenant_, args[0]);
  if (total == 0) {
    out_ << "No file named " << args[0] << std::endl;
    return;
  }

  // Reassemble in index order 0..total-1
  std::vector<uint8_t> content;
  for (uint64_t index = 0; index < total; ++index) {
    const auto payload = file_service_.get_file_chunk(tenant_, args[0], index);
    if (!payload) {
      out_ << "Chunk " << index << " of " << args[0] << " is missing" << std::endl;
      return;
    }
    content.insert(content.end(), payload->begin(), payload->end());
  }

  write_local_file(args[1], content);
  out_ << "Wrote " << content.size() << " bytes to " << args[1] << std::endl;
}

void CLI::handle_type_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    out_ << "Usage: type <name>" << std::endl;
    return;
  }
  const auto file_type = file_service_.get_file_type(tenant_, args[0]);
  out_ << (file_type ? *file_type : "No file named " + args[0]) << std::endl;
}

void CLI::handle_delete_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    out_ << "Usage: delete <name>" << std::endl;
    return;
  }
  if (file_service_.delete_file(tenant_, args[0])) {
    out_ << "File deleted successfully" << std::endl;
  } else {
    out_ << "No file named " << args[0] << std::endl;
  }
}

void CLI::handle_save_command() {
  file_service_.save(snapshot_path_);
  out_ << "Snapshot saved to " << snapshot_path_.string() << std::endl;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                               Display this help message" << std::endl;
  out_ << "  whoami                             Print the current tenant" << std::endl;
  out_ << "  tenant <id>                        Act as tenant <id>" << std::endl;
  out_ << "  ls                                 List files of the current tenant" << std::endl;
  out_ << "  exists <name>                      Check whether <name> is stored" << std::endl;
  out_ << "  upload <file> <name> <idx> <type>  Store local <file> as chunk <idx> of <name>" << std::endl;
  out_ << "  put <file> <name> <type>           Store local <file> as new <name> in 1 MiB chunks" << std::endl;
  out_ << "  chunks <name>                      Print the number of chunks of <name>" << std::endl;
  out_ << "  get <name> <idx> [file]            Print chunk <idx> of <name> or write it to [file]" << std::endl;
  out_ << "  fetch <name> <file>                Reassemble chunks 0..n-1 of <name> into <file>" << std::endl;
  out_ << "  type <name>                        Print the file type of <name>" << std::endl;
  out_ << "  delete <name>                      Delete <name>" << std::endl;
  out_ << "  save                               Write a snapshot now" << std::endl;
  out_ << "  quit                               Save and exit" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}


//==============================================
// LOCAL FILE ACCESS
//==============================================

std::vector<uint8_t> CLI::read_local_file(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open local file: " + path);
  }
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

void CLI::write_local_file(const std::string& path, const std::vector<uint8_t>& data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("Cannot create local file: " + path);
  }
  file.write(reinterpret_cast<const char*>(data.data()), data.size());
  if (!file) {
    throw std::runtime_error("Failed to write local file: " + path);
  }
}

uint64_t CLI::parse_index(const std::string& text) {
  std::size_t consumed = 0;
  const unsigned long long value = std::stoull(text, &consumed);
  if (consumed != text.size() || text[0] == '-') {
    throw std::invalid_argument("Invalid chunk index: " + text);
  }
  return value;
}

} // namespace cli
} // namespace cfs
