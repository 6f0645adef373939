// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/types.hpp"

#include <map>
#include <set>
#include <vector>

namespace overlay {
namespace discovery {

// ServiceIndex - advertised services per identity, kept independently of
// verification state, with a reverse service -> identities map.
class ServiceIndex {
public:
  // Union `services` into the identity's set. Returns number of new entries.
  size_t Merge(const IdentityKey& key, const ServiceSet& services);

  ServiceSet Get(const IdentityKey& key) const;
  bool Has(const IdentityKey& key, const ServiceId& service) const;

  // Identities that advertised `service`, verified or not
  std::set<IdentityKey> Providers(const ServiceId& service) const;

  // Drop every entry of the identity. Returns false if it had none.
  bool Erase(const IdentityKey& key);

  // Every recorded identity, verified or not, ordered by key
  const std::map<IdentityKey, ServiceSet>& All() const { return services_; }

  size_t IdentityCount() const { return services_.size(); }
  size_t EntryCount() const;

private:
  std::map<IdentityKey, ServiceSet> services_;
  std::map<ServiceId, std::set<IdentityKey>> providers_;
};

}  // namespace discovery
}  // namespace overlay
