#ifndef CFS_STORE_CHUNKED_FILE_HPP
#define CFS_STORE_CHUNKED_FILE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace cfs {
namespace store {

// Opaque caller identity supplied by the hosting environment
using TenantId = std::string;

// One indexed fragment of a file's content
struct Chunk {
  uint64_t index = 0;
  std::vector<uint8_t> payload;
};

// A stored file: chunks are kept in insertion order, not index order.
// total_size is the sum of all payload sizes in chunks.
struct ChunkedFile {
  std::string name;
  std::vector<Chunk> chunks;
  uint64_t total_size = 0;
  std::string file_type;
};

// Listing view of a stored file
struct FileSummary {
  std::string name;
  uint64_t size = 0;
  std::string file_type;
};

inline bool operator==(const Chunk& lhs, const Chunk& rhs) {
  return lhs.index == rhs.index && lhs.payload == rhs.payload;
}

inline bool operator==(const ChunkedFile& lhs, const ChunkedFile& rhs) {
  return lhs.name == rhs.name
      && lhs.chunks == rhs.chunks
      && lhs.total_size == rhs.total_size
      && lhs.file_type == rhs.file_type;
}

inline bool operator==(const FileSummary& lhs, const FileSummary& rhs) {
  return lhs.name == rhs.name && lhs.size == rhs.size && lhs.file_type == rhs.file_type;
}

} // namespace store
} // namespace cfs

#endif // CFS_STORE_CHUNKED_FILE_HPP
