#ifndef CFS_PERSISTENCE_SNAPSHOT_CODEC_HPP
#define CFS_PERSISTENCE_SNAPSHOT_CODEC_HPP

#include <string>
#include <utility>
#include <vector>
#include "store/chunked_file.hpp"
#include "store/tenant_store.hpp"

namespace cfs::persistence {

// All files of one tenant, flattened
struct TenantSnapshot {
  store::TenantId tenant;
  std::vector<std::pair<std::string, store::ChunkedFile>> files;
};

// Value-only image of the whole registry, safe to serialize
using Snapshot = std::vector<TenantSnapshot>;

inline bool operator==(const TenantSnapshot& lhs, const TenantSnapshot& rhs) {
  return lhs.tenant == rhs.tenant && lhs.files == rhs.files;
}

class SnapshotCodec {
public:
  // Walks tenant -> files -> chunks and copies every value out.
  // Tenants come out in tenant id order, files in name order.
  static Snapshot flatten(const store::TenantMap& tenants);

  // Builds fresh tenant stores from a snapshot. Entries are inserted as they
  // are; a repeated tenant or file name overwrites the earlier one.
  static store::TenantMap rebuild(const Snapshot& snapshot);

  // Counts used for logging and checkpoint reports
  static std::size_t count_files(const Snapshot& snapshot);
  static uint64_t count_bytes(const Snapshot& snapshot);
};

} // namespace cfs::persistence

#endif // CFS_PERSISTENCE_SNAPSHOT_CODEC_HPP
