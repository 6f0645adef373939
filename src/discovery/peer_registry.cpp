// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/peer_registry.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

#include <limits>

using json = nlohmann::json;

namespace overlay {
namespace discovery {

using NodeKey = ProvenanceGraph::NodeKey;

PeerRegistry::PeerRegistry(const Config& config) {
  for (const auto& addr : config.blacklisted_addresses) {
    blacklist_.Add(addr);
  }
  if (!config.blacklist_file.empty() && !blacklist_.LoadFromFile(config.blacklist_file)) {
    LOG_DISC_ERROR("PeerRegistry: continuing without exclusion list {}", config.blacklist_file);
  }
  LOG_DISC_DEBUG("PeerRegistry: initialized with {} blacklist entries", blacklist_.Size());
}

// ============================================================================
// Mutations
// ============================================================================

bool PeerRegistry::AddVerifiedPeerLocked(const VerifiedPeer& peer, bool check_address_blacklist) {
  if (blacklist_.IsIdentityBlacklisted(peer.key)) {
    LOG_DISC_TRACE("PeerRegistry: refusing blacklisted identity {}", peer.key.ToHex());
    return false;
  }
  if (check_address_blacklist && blacklist_.IsBlacklisted(peer.address)) {
    LOG_DISC_TRACE("PeerRegistry: refusing peer {} at blacklisted address {}", peer.key.ToHex(),
                   peer.address.ToString());
    return false;
  }

  if (const auto* existing = verified_.Find(peer.key)) {
    // Known identity: refresh the record, never touch its edges
    bool moved = existing->address != peer.address;
    verified_.Update(peer);
    if (moved) {
      LOG_DISC_DEBUG("PeerRegistry: peer {} now at {}", peer.key.ToHex(), peer.address.ToString());
      if (graph_.Absorb(peer.address, peer.key)) {
        LOG_DISC_DEBUG("PeerRegistry: absorbed introduced address {} into {}", peer.address.ToString(),
                       peer.key.ToHex());
      }
    }
    return true;
  }

  if (graph_.Absorb(peer.address, peer.key)) {
    LOG_DISC_DEBUG("PeerRegistry: promoted {} to verified peer {}", peer.address.ToString(), peer.key.ToHex());
  } else {
    graph_.AddNode(NodeKey{peer.key});
    LOG_DISC_DEBUG("PeerRegistry: new verified peer {} at {}", peer.key.ToHex(), peer.address.ToString());
  }
  verified_.Insert(peer);
  return true;
}

void PeerRegistry::DiscoverAddress(const VerifiedPeer& introducer, const Address& addr) {
  std::lock_guard<std::mutex> lock(mutex_);

  // The blacklist governs introduced addresses, not introducers
  if (!AddVerifiedPeerLocked(introducer, false)) {
    return;
  }

  if (blacklist_.IsBlacklisted(addr)) {
    LOG_DISC_TRACE("PeerRegistry: dropping introduction of blacklisted {}", addr.ToString());
    return;
  }
  if (verified_.KeyForAddress(addr)) {
    LOG_DISC_TRACE("PeerRegistry: {} already belongs to a verified peer", addr.ToString());
    return;
  }

  const NodeKey target{addr};
  if (graph_.GetParent(target)) {
    LOG_DISC_TRACE("PeerRegistry: {} already introduced, keeping existing introducer", addr.ToString());
    return;
  }

  bool created = graph_.AddNode(target);
  graph_.AddEdge(NodeKey{introducer.key}, target, util::GetTime());
  LOG_DISC_TRACE("PeerRegistry: {} {} introduced by {}", created ? "new address" : "orphaned address",
                 addr.ToString(), introducer.key.ToHex());
}

void PeerRegistry::DiscoverServices(const VerifiedPeer& peer, const ServiceSet& services) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t added = services_.Merge(peer.key, services);
  if (added > 0) {
    LOG_DISC_TRACE("PeerRegistry: {} new services for {}", added, peer.key.ToHex());
  }
}

void PeerRegistry::AddVerifiedPeer(const VerifiedPeer& peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  AddVerifiedPeerLocked(peer, true);
}

void PeerRegistry::RemoveIdentityLocked(const IdentityKey& key) {
  graph_.RemoveNode(NodeKey{key});
  verified_.Erase(key);
  services_.Erase(key);
}

void PeerRegistry::RemovePeer(const VerifiedPeer& peer) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (verified_.Contains(peer.key) || graph_.HasPeerNode(peer.key)) {
    RemoveIdentityLocked(peer.key);
    LOG_DISC_DEBUG("PeerRegistry: removed verified peer {}", peer.key.ToHex());
    return;
  }

  // Known only through an introduction
  bool removed = graph_.RemoveNode(NodeKey{peer.address});
  removed |= services_.Erase(peer.key);
  if (removed) {
    LOG_DISC_DEBUG("PeerRegistry: removed unverified peer {} at {}", peer.key.ToHex(), peer.address.ToString());
  } else {
    LOG_DISC_TRACE("PeerRegistry: remove of unknown peer {} ignored", peer.key.ToHex());
  }
}

void PeerRegistry::RemoveByAddress(const Address& addr) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (auto key = verified_.KeyForAddress(addr)) {
    RemoveIdentityLocked(*key);
    LOG_DISC_DEBUG("PeerRegistry: removed verified peer {} by address {}", key->ToHex(), addr.ToString());
    return;
  }
  if (graph_.RemoveNode(NodeKey{addr})) {
    LOG_DISC_DEBUG("PeerRegistry: removed introduced address {}", addr.ToString());
    return;
  }
  LOG_DISC_TRACE("PeerRegistry: remove of unknown address {} ignored", addr.ToString());
}

// ============================================================================
// Blacklist
// ============================================================================

void PeerRegistry::BlacklistAddress(const Address& addr) {
  std::lock_guard<std::mutex> lock(mutex_);
  blacklist_.Add(addr);
}

void PeerRegistry::BlacklistIdentity(const IdentityKey& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  blacklist_.AddIdentity(key);
}

bool PeerRegistry::IsBlacklisted(const Address& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blacklist_.IsBlacklisted(addr);
}

bool PeerRegistry::LoadBlacklist(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return blacklist_.LoadFromFile(path);
}

// ============================================================================
// Queries
// ============================================================================

bool PeerRegistry::IsWalkableLocked(const Address& addr) const {
  return !blacklist_.IsBlacklisted(addr) && !verified_.KeyForAddress(addr);
}

std::vector<Address> PeerRegistry::GetWalkableAddresses(const std::optional<ServiceId>& service,
                                                        std::optional<int64_t> older_than) const {
  std::lock_guard<std::mutex> lock(mutex_);

  // Non-positive ages disable the filter; the cutoff saturates at the clock's lower bound
  std::optional<int64_t> cutoff;
  if (older_than && *older_than > 0) {
    const int64_t now = util::GetTime();
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    cutoff = now >= kMin + *older_than ? now - *older_than : kMin;
  }

  std::vector<Address> result;
  for (const auto& addr : graph_.AddressNodes()) {
    if (!IsWalkableLocked(addr)) {
      continue;
    }
    const NodeKey key{addr};
    if (service) {
      // Single hop: only the direct introducer's services count
      auto parent = graph_.GetParent(key);
      const auto* introducer = parent ? std::get_if<IdentityKey>(&*parent) : nullptr;
      if (!introducer || !services_.Has(*introducer, *service)) {
        continue;
      }
    }
    if (cutoff) {
      const auto* node = graph_.Find(key);
      if (!node || node->introduced_at > *cutoff) {
        continue;
      }
    }
    result.push_back(addr);
  }
  return result;
}

std::vector<Address> PeerRegistry::IntroductionsLocked(const IdentityKey& key) const {
  std::vector<Address> result;
  for (const auto& child : graph_.GetChildren(NodeKey{key})) {
    if (const auto* addr = std::get_if<Address>(&child)) {
      result.push_back(*addr);
    }
  }
  return result;
}

std::vector<Address> PeerRegistry::GetIntroductionsFrom(const VerifiedPeer& peer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return IntroductionsLocked(peer.key);
}

std::optional<IdentityKey> PeerRegistry::GetIntroducer(const Address& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::optional<NodeKey> parent;
  if (graph_.HasAddressNode(addr)) {
    parent = graph_.GetParent(NodeKey{addr});
  } else if (auto key = verified_.KeyForAddress(addr)) {
    parent = graph_.GetParent(NodeKey{*key});
  }
  if (!parent) {
    return std::nullopt;
  }
  if (const auto* introducer = std::get_if<IdentityKey>(&*parent)) {
    return *introducer;
  }
  return std::nullopt;
}

ServiceSet PeerRegistry::GetServicesForPeer(const VerifiedPeer& peer) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return services_.Get(peer.key);
}

std::vector<VerifiedPeer> PeerRegistry::GetPeersForService(const ServiceId& service) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<VerifiedPeer> result;
  for (const auto& key : services_.Providers(service)) {
    if (const auto* peer = verified_.Find(key)) {
      result.push_back(*peer);
    }
  }
  return result;
}

std::optional<VerifiedPeer> PeerRegistry::GetVerifiedByAddress(const Address& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return verified_.GetByAddress(addr);
}

std::optional<VerifiedPeer> PeerRegistry::GetVerifiedByPublicKey(std::span<const uint8_t> public_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return verified_.GetByPublicKey(public_key);
}

std::optional<VerifiedPeer> PeerRegistry::GetVerifiedByKey(const IdentityKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return verified_.Get(key);
}

std::vector<VerifiedPeer> PeerRegistry::VerifiedPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return verified_.All();
}

size_t PeerRegistry::VerifiedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return verified_.Size();
}

bool PeerRegistry::HasAddressNode(const Address& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return graph_.HasAddressNode(addr);
}

bool PeerRegistry::HasPeerNode(const IdentityKey& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return graph_.HasPeerNode(key);
}

// ============================================================================
// Diagnostics
// ============================================================================

PeerRegistry::Stats PeerRegistry::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);

  Stats stats;
  stats.verified = verified_.Size();
  for (const auto& addr : graph_.AddressNodes()) {
    if (!IsWalkableLocked(addr)) {
      continue;
    }
    stats.walkable++;
    if (!graph_.GetParent(NodeKey{addr})) {
      stats.orphaned++;
    }
  }
  stats.edges = graph_.EdgeCount();
  stats.service_entries = services_.EntryCount();
  stats.blacklisted = blacklist_.Size();
  return stats;
}

json PeerRegistry::ToJson() const {
  std::lock_guard<std::mutex> lock(mutex_);

  json verified = json::array();
  for (const auto& peer : verified_.All()) {
    json services = json::array();
    for (const auto& service : services_.Get(peer.key)) {
      services.push_back(service.ToHex());
    }
    json introductions = json::array();
    for (const auto& addr : IntroductionsLocked(peer.key)) {
      introductions.push_back(addr.ToString());
    }
    json entry = {{"key", peer.key.ToHex()},
                  {"address", peer.address.ToString()},
                  {"services", services},
                  {"introductions", introductions}};
    verified.push_back(std::move(entry));
  }

  json walkable = json::array();
  for (const auto& addr : graph_.AddressNodes()) {
    if (!IsWalkableLocked(addr)) {
      continue;
    }
    const NodeKey key{addr};
    json entry = {{"address", addr.ToString()}, {"introducer", nullptr}};
    auto parent = graph_.GetParent(key);
    if (const auto* introducer = parent ? std::get_if<IdentityKey>(&*parent) : nullptr) {
      entry["introducer"] = introducer->ToHex();
      entry["introduced_at"] = graph_.Find(key)->introduced_at;
    }
    walkable.push_back(std::move(entry));
  }

  // Includes identities that advertised services before being verified
  json services = json::object();
  for (const auto& [key, set] : services_.All()) {
    json ids = json::array();
    for (const auto& service : set) {
      ids.push_back(service.ToHex());
    }
    services[key.ToHex()] = std::move(ids);
  }

  json result;
  result["verified"] = std::move(verified);
  result["walkable"] = std::move(walkable);
  result["services"] = std::move(services);
  result["blacklisted"] = blacklist_.Size();
  return result;
}

}  // namespace discovery
}  // namespace overlay
