#ifndef CFS_STORE_REGISTRY_HPP
#define CFS_STORE_REGISTRY_HPP

#include <memory>
#include <mutex>
#include "store/tenant_store.hpp"
#include "persistence/snapshot_codec.hpp"

namespace cfs {
namespace store {

class StoreRegistry {
public:
  // Delete copy constructor and assignment operator
  StoreRegistry(const StoreRegistry&) = delete;
  StoreRegistry& operator=(const StoreRegistry&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  StoreRegistry();
  ~StoreRegistry() = default;


  // ---- TENANT RESOLUTION ----
  // Returns the tenant's store, inserting an empty one on first access
  std::shared_ptr<TenantStore> resolve(const TenantId& tenant);


  // ---- PERSISTENCE BOUNDARY ----
  // Point-in-time flattened copy of every tenant and file
  persistence::Snapshot snapshot() const;
  // Replaces the whole registry with the snapshot contents
  void restore(const persistence::Snapshot& snapshot);


  // ---- UTILITY METHODS ----
  // Probe that never inserts
  bool has_tenant(const TenantId& tenant) const;
  std::size_t size() const;
  void clear();

private:
  // ---- PARAMETERS ----
  // Tenant stores and access mutex
  TenantMap tenants_;
  mutable std::mutex mutex_;
};

} // namespace store
} // namespace cfs

#endif // CFS_STORE_REGISTRY_HPP
