#include "persistence/snapshot_codec.hpp"
#include <boost/log/trivial.hpp>
#include <memory>

namespace cfs::persistence {

Snapshot SnapshotCodec::flatten(const store::TenantMap& tenants) {
  BOOST_LOG_TRIVIAL(debug) << "Snapshot codec: Flattening " << tenants.size() << " tenants";

  Snapshot snapshot;
  snapshot.reserve(tenants.size());

  for (const auto& [tenant, tenant_store] : tenants) {
    if (!tenant_store) {
      BOOST_LOG_TRIVIAL(warning) << "Snapshot codec: Skipping tenant without store: " << tenant;
      continue;
    }
    // export_files copies under the tenant lock, so each tenant is consistent
    snapshot.push_back(TenantSnapshot{tenant, tenant_store->export_files()});
  }

  BOOST_LOG_TRIVIAL(info) << "Snapshot codec: Flattened " << snapshot.size() << " tenants, "
                          << count_files(snapshot) << " files";
  return snapshot;
}

store::TenantMap SnapshotCodec::rebuild(const Snapshot& snapshot) {
  BOOST_LOG_TRIVIAL(debug) << "Snapshot codec: Rebuilding registry from " << snapshot.size() << " tenant entries";

  store::TenantMap tenants;

  for (const auto& entry : snapshot) {
    // A repeated tenant entry starts over with a fresh store
    auto tenant_store = std::make_shared<store::TenantStore>(entry.tenant);
    for (const auto& [name, file] : entry.files) {
      tenant_store->import_file(name, file);
    }
    tenants[entry.tenant] = std::move(tenant_store);
  }

  BOOST_LOG_TRIVIAL(info) << "Snapshot codec: Rebuilt " << tenants.size() << " tenants";
  return tenants;
}

std::size_t SnapshotCodec::count_files(const Snapshot& snapshot) {
  std::size_t files = 0;
  for (const auto& entry : snapshot) {
    files += entry.files.size();
  }
  return files;
}

uint64_t SnapshotCodec::count_bytes(const Snapshot& snapshot) {
  uint64_t bytes = 0;
  for (const auto& entry : snapshot) {
    for (const auto& file : entry.files) {
      bytes += file.second.total_size;
    }
  }
  return bytes;
}

} // namespace cfs::persistence
