// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/verified_peer_index.hpp"

namespace overlay {
namespace discovery {

void VerifiedPeerIndex::IndexPeer(const VerifiedPeer& peer) {
  by_address_[peer.address] = peer.key;
  if (!peer.public_key.empty()) {
    by_public_key_[peer.public_key] = peer.key;
  }
}

void VerifiedPeerIndex::UnindexPeer(const VerifiedPeer& peer) {
  auto addr_it = by_address_.find(peer.address);
  if (addr_it != by_address_.end() && addr_it->second == peer.key) {
    by_address_.erase(addr_it);
    for (const auto& [key, other] : peers_) {
      if (key != peer.key && other.address == peer.address) {
        by_address_.emplace(other.address, key);
        break;
      }
    }
  }
  auto pk_it = by_public_key_.find(peer.public_key);
  if (pk_it != by_public_key_.end() && pk_it->second == peer.key) {
    by_public_key_.erase(pk_it);
  }
}

bool VerifiedPeerIndex::Insert(const VerifiedPeer& peer) {
  auto [it, inserted] = peers_.emplace(peer.key, peer);
  if (!inserted) {
    return false;
  }
  IndexPeer(it->second);
  return true;
}

bool VerifiedPeerIndex::Update(const VerifiedPeer& peer) {
  auto it = peers_.find(peer.key);
  if (it == peers_.end()) {
    return false;
  }
  UnindexPeer(it->second);
  it->second = peer;
  IndexPeer(it->second);
  return true;
}

bool VerifiedPeerIndex::Erase(const IdentityKey& key) {
  auto it = peers_.find(key);
  if (it == peers_.end()) {
    return false;
  }
  VerifiedPeer removed = std::move(it->second);
  peers_.erase(it);
  UnindexPeer(removed);
  return true;
}

const VerifiedPeer* VerifiedPeerIndex::Find(const IdentityKey& key) const {
  auto it = peers_.find(key);
  return it == peers_.end() ? nullptr : &it->second;
}

std::optional<VerifiedPeer> VerifiedPeerIndex::Get(const IdentityKey& key) const {
  const auto* peer = Find(key);
  if (!peer) {
    return std::nullopt;
  }
  return *peer;
}

std::optional<IdentityKey> VerifiedPeerIndex::KeyForAddress(const Address& addr) const {
  auto it = by_address_.find(addr);
  if (it == by_address_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<VerifiedPeer> VerifiedPeerIndex::GetByAddress(const Address& addr) const {
  auto key = KeyForAddress(addr);
  if (!key) {
    return std::nullopt;
  }
  return Get(*key);
}

std::optional<VerifiedPeer> VerifiedPeerIndex::GetByPublicKey(std::span<const uint8_t> public_key) const {
  auto it = by_public_key_.find(std::vector<uint8_t>(public_key.begin(), public_key.end()));
  if (it == by_public_key_.end()) {
    return std::nullopt;
  }
  return Get(it->second);
}

std::vector<VerifiedPeer> VerifiedPeerIndex::All() const {
  std::vector<VerifiedPeer> result;
  result.reserve(peers_.size());
  for (const auto& [key, peer] : peers_) {
    result.push_back(peer);
  }
  return result;
}

}  // namespace discovery
}  // namespace overlay
