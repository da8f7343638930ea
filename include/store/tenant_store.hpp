#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "store/chunked_file.hpp"

namespace cfs {
namespace store {

class TenantStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TenantStore(const TenantId& tenant);

  TenantStore(const TenantStore&) = delete;
  TenantStore& operator=(const TenantStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Creates the file with a single chunk or appends to the existing one.
  // file_type always takes the newly supplied value. Returns false when the
  // chunk index is already present in the file; that chunk is discarded.
  bool append_chunk(const std::string& name, Chunk chunk, const std::string& file_type);
  // Removes the file, returns whether it was present
  bool remove(const std::string& name);


  // ---- QUERY OPERATIONS ----
  bool exists(const std::string& name) const;
  std::vector<FileSummary> list_files() const;
  // Number of chunks stored for name, 0 when the file is absent
  uint64_t chunk_count(const std::string& name) const;
  // Payload of the first chunk (insertion order) carrying the given index
  std::optional<std::vector<uint8_t>> get_chunk(const std::string& name, uint64_t index) const;
  std::optional<std::string> get_file_type(const std::string& name) const;
  std::size_t file_count() const;

  const TenantId& tenant() const { return tenant_; }


  // ---- SNAPSHOT SUPPORT ----
  // Copies every file out in name order
  std::vector<std::pair<std::string, ChunkedFile>> export_files() const;
  // Inserts a file verbatim, replacing any file with the same name
  void import_file(const std::string& name, ChunkedFile file);

private:
  // ---- PARAMETERS ----
  TenantId tenant_;

  // Files by name and access mutex
  std::map<std::string, ChunkedFile> files_;
  mutable std::mutex mutex_;


  // ---- LOOKUP ----
  // Returns the first chunk carrying index, nullptr if none does
  static const Chunk* find_chunk(const ChunkedFile& file, uint64_t index);
};

// Live tenant stores keyed by tenant id
using TenantMap = std::map<TenantId, std::shared_ptr<TenantStore>>;

} // namespace store
} // namespace cfs
