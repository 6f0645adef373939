// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/types.hpp"

#include <map>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace overlay {
namespace discovery {

// VerifiedPeerIndex - verified peers keyed by IdentityKey, with secondary
// lookup by current address and by public key. Not thread-safe.
class VerifiedPeerIndex {
public:
  // Insert a new peer. Returns false if the identity is already present.
  bool Insert(const VerifiedPeer& peer);

  // Replace the stored record of an existing identity, re-keying the address
  // and public key lookups. Returns false if the identity is unknown.
  bool Update(const VerifiedPeer& peer);

  bool Erase(const IdentityKey& key);

  bool Contains(const IdentityKey& key) const { return peers_.count(key) > 0; }

  const VerifiedPeer* Find(const IdentityKey& key) const;
  std::optional<VerifiedPeer> Get(const IdentityKey& key) const;

  std::optional<IdentityKey> KeyForAddress(const Address& addr) const;
  std::optional<VerifiedPeer> GetByAddress(const Address& addr) const;
  std::optional<VerifiedPeer> GetByPublicKey(std::span<const uint8_t> public_key) const;

  // Snapshot ordered by IdentityKey
  std::vector<VerifiedPeer> All() const;

  size_t Size() const { return peers_.size(); }

private:
  void IndexPeer(const VerifiedPeer& peer);
  void UnindexPeer(const VerifiedPeer& peer);

  std::map<IdentityKey, VerifiedPeer> peers_;
  // Several identities may share an address (NAT); the newest one wins and
  // removal falls back to any remaining holder.
  std::unordered_map<Address, IdentityKey> by_address_;
  std::map<std::vector<uint8_t>, IdentityKey> by_public_key_;
};

}  // namespace discovery
}  // namespace overlay
