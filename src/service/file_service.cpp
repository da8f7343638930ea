#include "service/file_service.hpp"
#include "persistence/snapshot_file.hpp"
#include <boost/log/trivial.hpp>

namespace cfs {
namespace service {

FileService::FileService(store::StoreRegistry& registry) : registry_(registry) {
  BOOST_LOG_TRIVIAL(info) << "File service: Initialized";
}


//==============================================
// PROCESSING OF USER REQUESTS
//==============================================

bool FileService::check_file_exists(const store::TenantId& tenant, const std::string& name) {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  return registry_.resolve(tenant)->exists(name);
}

bool FileService::upload_file_chunk(const store::TenantId& tenant, const std::string& name,
                                    std::vector<uint8_t> payload, uint64_t index,
                                    const std::string& file_type) {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  BOOST_LOG_TRIVIAL(debug) << "File service: Upload of chunk " << index << " for " << name
                           << " from tenant " << tenant << " (" << payload.size() << " bytes)";

  store::Chunk chunk;
  chunk.index = index;
  chunk.payload = std::move(payload);
  return registry_.resolve(tenant)->append_chunk(name, std::move(chunk), file_type);
}

std::vector<store::FileSummary> FileService::get_files(const store::TenantId& tenant) {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  return registry_.resolve(tenant)->list_files();
}

uint64_t FileService::get_total_chunks(const store::TenantId& tenant, const std::string& name) {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  return registry_.resolve(tenant)->chunk_count(name);
}

std::optional<std::vector<uint8_t>> FileService::get_file_chunk(const store::TenantId& tenant,
                                                                const std::string& name, uint64_t index) {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  return registry_.resolve(tenant)->get_chunk(name, index);
}

std::optional<std::string> FileService::get_file_type(const store::TenantId& tenant, const std::string& name) {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  return registry_.resolve(tenant)->get_file_type(name);
}

bool FileService::delete_file(const store::TenantId& tenant, const std::string& name) {
  std::shared_lock<std::shared_mutex> lock(lifecycle_mutex_);
  return registry_.resolve(tenant)->remove(name);
}


//==============================================
// LIFECYCLE
//==============================================

persistence::Snapshot FileService::snapshot() {
  std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
  return registry_.snapshot();
}

void FileService::restore(const persistence::Snapshot& snapshot) {
  std::unique_lock<std::shared_mutex> lock(lifecycle_mutex_);
  registry_.restore(snapshot);
}

void FileService::save(const std::filesystem::path& path) {
  std::lock_guard<std::mutex> save_lock(save_mutex_);

  // Writing to disk happens after the lifecycle lock is released
  persistence::Snapshot current = snapshot();
  persistence::SnapshotFile::save_snapshot_file(current, path);
  BOOST_LOG_TRIVIAL(info) << "File service: Checkpoint written: " << current.size() << " tenants, "
                          << persistence::SnapshotCodec::count_bytes(current) << " bytes of file data";
}

bool FileService::load(const std::filesystem::path& path) {
  std::optional<persistence::Snapshot> loaded = persistence::SnapshotFile::load_snapshot_file(path);
  if (!loaded) {
    return false;
  }

  restore(*loaded);
  return true;
}

} // namespace service
} // namespace cfs
