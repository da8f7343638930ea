#ifndef CFS_SERVICE_FILE_SERVICE_HPP
#define CFS_SERVICE_FILE_SERVICE_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "store/store_registry.hpp"
#include "persistence/snapshot_codec.hpp"

namespace cfs {
namespace service {

class FileService {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileService(store::StoreRegistry& registry);

  FileService(const FileService&) = delete;
  FileService& operator=(const FileService&) = delete;


  // ---- PROCESSING OF USER REQUESTS ----
  // Every request is scoped to the caller's tenant
  bool check_file_exists(const store::TenantId& tenant, const std::string& name);
  // Returns false when the file already holds a chunk with this index; the chunk is discarded
  bool upload_file_chunk(const store::TenantId& tenant, const std::string& name,
                         std::vector<uint8_t> payload, uint64_t index, const std::string& file_type);
  std::vector<store::FileSummary> get_files(const store::TenantId& tenant);
  uint64_t get_total_chunks(const store::TenantId& tenant, const std::string& name);
  std::optional<std::vector<uint8_t>> get_file_chunk(const store::TenantId& tenant,
                                                     const std::string& name, uint64_t index);
  std::optional<std::string> get_file_type(const store::TenantId& tenant, const std::string& name);
  bool delete_file(const store::TenantId& tenant, const std::string& name);


  // ---- LIFECYCLE ----
  // These run exclusively: no request is in flight while they execute
  persistence::Snapshot snapshot();
  void restore(const persistence::Snapshot& snapshot);
  // Snapshot written to path; throws SnapshotError on failure
  void save(const std::filesystem::path& path);
  // Restores from path; returns false when no snapshot file exists
  bool load(const std::filesystem::path& path);

private:
  // ---- PARAMETERS ----
  store::StoreRegistry& registry_;
  // Shared by requests, exclusive for snapshot and restore
  std::shared_mutex lifecycle_mutex_;
  // One writer of the snapshot file at a time
  std::mutex save_mutex_;
};

} // namespace service
} // namespace cfs

#endif // CFS_SERVICE_FILE_SERVICE_HPP
