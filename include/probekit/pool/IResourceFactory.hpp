// Repository: Probekit-core
// Component: Resource Factory Interface
// Purpose: The pool's only view of the resources it manages.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_POOL_IRESOURCE_FACTORY_HPP_
#define PROBEKIT_POOL_IRESOURCE_FACTORY_HPP_

#include <memory>
#include <string>

namespace probekit::pool {

// Implementations must be thread-safe: the pool calls Create from several
// acquiring threads at once and never holds its own lock while doing so.
template <typename Resource, typename Config>
class IResourceFactory {
 public:
  virtual ~IResourceFactory() = default;

  // Returns a ready resource or throws.
  virtual std::shared_ptr<Resource> Create(const Config& config) = 0;

  // Brings a released resource back to a clean state. false (or a throw)
  // means the resource is poisoned and the pool destroys it.
  virtual bool Reset(Resource& resource) = 0;

  // Releases the underlying OS resources. Failures are logged by the pool.
  virtual void Destroy(Resource& resource) = 0;

  // Canonical key over the subset of `config` that decides reuse.
  virtual std::string ConfigKey(const Config& config) const = 0;

  // Short name used in resource ids and events.
  virtual std::string TypeName() const = 0;
};

}  // namespace probekit::pool

#endif  // PROBEKIT_POOL_IRESOURCE_FACTORY_HPP_
