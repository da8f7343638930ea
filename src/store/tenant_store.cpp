#include "store/tenant_store.hpp"
#include <boost/log/trivial.hpp>

namespace cfs {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TenantStore::TenantStore(const TenantId& tenant) : tenant_(tenant) {
  BOOST_LOG_TRIVIAL(debug) << "Tenant store: Created store for tenant: " << tenant_;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

bool TenantStore::append_chunk(const std::string& name, Chunk chunk, const std::string& file_type) {
  std::lock_guard<std::mutex> lock(mutex_);

  const uint64_t chunk_size = chunk.payload.size();
  auto it = files_.find(name);

  // First chunk creates the file
  if (it == files_.end()) {
    ChunkedFile file;
    file.name = name;
    file.total_size = chunk_size;
    file.file_type = file_type;
    file.chunks.push_back(std::move(chunk));
    files_.emplace(name, std::move(file));

    BOOST_LOG_TRIVIAL(info) << "Tenant store: Created file " << name << " for tenant " << tenant_
                            << " (" << chunk_size << " bytes, type " << file_type << ")";
    return true;
  }

  ChunkedFile& file = it->second;
  file.file_type = file_type;

  // The first chunk stored under an index wins
  if (find_chunk(file, chunk.index) != nullptr) {
    BOOST_LOG_TRIVIAL(warning) << "Tenant store: Discarding duplicate chunk " << chunk.index
                               << " for file " << name << " of tenant " << tenant_;
    return false;
  }

  const uint64_t index = chunk.index;
  file.chunks.push_back(std::move(chunk));
  file.total_size += chunk_size;

  BOOST_LOG_TRIVIAL(debug) << "Tenant store: Appended chunk " << index << " (" << chunk_size
                           << " bytes) to " << name << ", total size now " << file.total_size;
  return true;
}

bool TenantStore::remove(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (files_.erase(name) == 0) {
    BOOST_LOG_TRIVIAL(debug) << "Tenant store: Nothing to remove for " << name << " of tenant " << tenant_;
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Tenant store: Removed file " << name << " for tenant " << tenant_;
  return true;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool TenantStore::exists(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.count(name) > 0;
}

std::vector<FileSummary> TenantStore::list_files() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<FileSummary> summaries;
  summaries.reserve(files_.size());
  for (const auto& [name, file] : files_) {
    summaries.push_back(FileSummary{name, file.total_size, file.file_type});
  }
  return summaries;
}

uint64_t TenantStore::chunk_count(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = files_.find(name);
  if (it == files_.end()) {
    return 0;
  }
  return it->second.chunks.size();
}

std::optional<std::vector<uint8_t>> TenantStore::get_chunk(const std::string& name, uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = files_.find(name);
  if (it == files_.end()) {
    BOOST_LOG_TRIVIAL(debug) << "Tenant store: File not found: " << name;
    return std::nullopt;
  }

  const Chunk* chunk = find_chunk(it->second, index);
  if (chunk == nullptr) {
    BOOST_LOG_TRIVIAL(debug) << "Tenant store: Chunk " << index << " not found in " << name;
    return std::nullopt;
  }
  return chunk->payload;
}

std::optional<std::string> TenantStore::get_file_type(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = files_.find(name);
  if (it == files_.end()) {
    return std::nullopt;
  }
  return it->second.file_type;
}

std::size_t TenantStore::file_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.size();
}


//==============================================
// SNAPSHOT SUPPORT
//==============================================

std::vector<std::pair<std::string, ChunkedFile>> TenantStore::export_files() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::pair<std::string, ChunkedFile>>(files_.begin(), files_.end());
}

void TenantStore::import_file(const std::string& name, ChunkedFile file) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_[name] = std::move(file);
}


//==============================================
// LOOKUP
//==============================================

const Chunk* TenantStore::find_chunk(const ChunkedFile& file, uint64_t index) {
  for (const auto& chunk : file.chunks) {
    if (chunk.index == index) {
      return &chunk;
    }
  }
  return nullptr;
}

} // namespace store
} // namespace cfs
