// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/service_index.hpp"

namespace overlay {
namespace discovery {

size_t ServiceIndex::Merge(const IdentityKey& key, const ServiceSet& services) {
  if (services.empty()) {
    return 0;
  }
  auto& known = services_[key];
  size_t added = 0;
  for (const auto& service : services) {
    if (known.insert(service).second) {
      providers_[service].insert(key);
      ++added;
    }
  }
  return added;
}

ServiceSet ServiceIndex::Get(const IdentityKey& key) const {
  auto it = services_.find(key);
  if (it == services_.end()) {
    return {};
  }
  return it->second;
}

bool ServiceIndex::Has(const IdentityKey& key, const ServiceId& service) const {
  auto it = services_.find(key);
  return it != services_.end() && it->second.count(service) > 0;
}

std::set<IdentityKey> ServiceIndex::Providers(const ServiceId& service) const {
  auto it = providers_.find(service);
  if (it == providers_.end()) {
    return {};
  }
  return it->second;
}

bool ServiceIndex::Erase(const IdentityKey& key) {
  auto it = services_.find(key);
  if (it == services_.end()) {
    return false;
  }
  for (const auto& service : it->second) {
    auto prov_it = providers_.find(service);
    if (prov_it == providers_.end()) {
      continue;
    }
    prov_it->second.erase(key);
    if (prov_it->second.empty()) {
      providers_.erase(prov_it);
    }
  }
  services_.erase(it);
  return true;
}

size_t ServiceIndex::EntryCount() const {
  size_t total = 0;
  for (const auto& [key, services] : services_) {
    total += services.size();
  }
  return total;
}

}  // namespace discovery
}  // namespace overlay
