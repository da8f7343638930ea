#include "store/store_registry.hpp"
#include <boost/log/trivial.hpp>

namespace cfs {
namespace store {

StoreRegistry::StoreRegistry() {
  BOOST_LOG_TRIVIAL(info) << "Store registry: Initialized empty registry";
}

std::shared_ptr<TenantStore> StoreRegistry::resolve(const TenantId& tenant) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Lookup and insert happen under one lock so a new tenant gets exactly one store
  auto it = tenants_.find(tenant);
  if (it != tenants_.end()) {
    return it->second;
  }

  auto tenant_store = std::make_shared<TenantStore>(tenant);
  tenants_.emplace(tenant, tenant_store);
  BOOST_LOG_TRIVIAL(info) << "Store registry: Added store for tenant: " << tenant
                          << " (" << tenants_.size() << " tenants)";
  return tenant_store;
}

persistence::Snapshot StoreRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(info) << "Store registry: Taking snapshot of " << tenants_.size() << " tenants";
  return persistence::SnapshotCodec::flatten(tenants_);
}

void StoreRegistry::restore(const persistence::Snapshot& snapshot) {
  // Build outside the lock, then swap the whole map in
  TenantMap rebuilt = persistence::SnapshotCodec::rebuild(snapshot);

  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t previous = tenants_.size();
  tenants_.swap(rebuilt);
  BOOST_LOG_TRIVIAL(info) << "Store registry: Restored " << tenants_.size()
                          << " tenants, replaced " << previous;
}

bool StoreRegistry::has_tenant(const TenantId& tenant) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tenants_.count(tenant) > 0;
}

std::size_t StoreRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tenants_.size();
}

void StoreRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(info) << "Store registry: Clearing " << tenants_.size() << " tenants";
  tenants_.clear();
}

} // namespace store
} // namespace cfs
