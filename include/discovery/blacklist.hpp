// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Blacklist — endpoints and identities that must never enter the registry

 Purpose
 - Address entries: introductions of these endpoints are dropped, and a
   verified peer at one of them is not registered
 - Identity entries: a peer with this fingerprint is never registered, even
   as an introducer
 - Load a static exclusion list from a JSON file

 File format
   {
     "addresses":  ["1.2.3.4:8090", "[2001:db8::1]:8090"],
     "identities": ["<40 hex chars>"]
   }

 Not thread-safe; PeerRegistry serializes access.
*/

#include "discovery/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace overlay {
namespace discovery {

class Blacklist {
public:
  void Add(const Address& addr) { addresses_.insert(addr); }
  bool Remove(const Address& addr) { return addresses_.erase(addr) > 0; }
  bool IsBlacklisted(const Address& addr) const { return addresses_.count(addr) > 0; }

  void AddIdentity(const IdentityKey& key) { identities_.insert(key); }
  bool RemoveIdentity(const IdentityKey& key) { return identities_.erase(key) > 0; }
  bool IsIdentityBlacklisted(const IdentityKey& key) const { return identities_.count(key) > 0; }

  // Load entries from a JSON exclusion list. A missing file is not an error.
  // Malformed entries are skipped; returns false only if the document itself
  // cannot be parsed.
  bool LoadFromFile(const std::string& path);

  std::vector<Address> Addresses() const { return {addresses_.begin(), addresses_.end()}; }

  size_t Size() const { return addresses_.size() + identities_.size(); }

private:
  std::set<Address> addresses_;
  std::set<IdentityKey> identities_;
};

}  // namespace discovery
}  // namespace overlay
