#ifndef CFS_PERSISTENCE_SNAPSHOT_FILE_HPP
#define CFS_PERSISTENCE_SNAPSHOT_FILE_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <boost/endian/conversion.hpp>
#include "persistence/snapshot_codec.hpp"
#include "persistence/persistence_error.hpp"

namespace cfs::persistence {

class SnapshotFile {
public:
  static constexpr std::array<char, 8> MAGIC = {'C', 'F', 'S', 'S', 'N', 'A', 'P', '1'};
  static constexpr uint32_t VERSION = 1;
  static constexpr std::size_t DIGEST_SIZE = 32;                    // SHA-256
  static constexpr uint32_t MAX_STRING_LENGTH = 256 * 1024 * 1024;  // 256 MiB


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Writes header, body and trailing digest. Returns total bytes written.
  static std::size_t write_snapshot(const Snapshot& snapshot, std::ostream& output);
  // Verifies the trailing digest, then parses the body. The stream must be seekable.
  static Snapshot read_snapshot(std::istream& input);


  // ---- FILE OPERATIONS ----
  // Writes to "<path>.tmp" and renames it over path
  static void save_snapshot_file(const Snapshot& snapshot, const std::filesystem::path& path);
  // Returns nullopt when no snapshot file exists yet
  static std::optional<Snapshot> load_snapshot_file(const std::filesystem::path& path);

private:
  // ---- BODY ENCODING ----
  static void write_body(const Snapshot& snapshot, std::ostream& output);
  // Parses from the current position up to body_end
  static Snapshot read_body(std::istream& input, std::streampos body_end);


  // ---- STREAM OPERATIONS ----
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  static void read_bytes(std::istream& input, void* data, std::size_t size);
  static void write_u32(std::ostream& output, uint32_t value);
  static void write_u64(std::ostream& output, uint64_t value);
  static uint32_t read_u32(std::istream& input);
  static uint64_t read_u64(std::istream& input);
  static void write_string(std::ostream& output, const std::string& value);
  static std::string read_string(std::istream& input, std::streampos body_end);
};

} // namespace cfs::persistence

#endif // CFS_PERSISTENCE_SNAPSHOT_FILE_HPP
