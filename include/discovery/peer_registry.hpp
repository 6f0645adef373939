// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 PeerRegistry — peer discovery bookkeeping for the overlay walker

 Purpose
 - Remember which peers were verified by the handshake layer
 - Remember addresses that were only introduced, and by whom
 - Track advertised services per identity
 - Answer the walker's queries for its next target

 Key responsibilities
 1. DiscoverAddress / AddVerifiedPeer keep the provenance graph and the
    verified-peer index consistent (a PeerNode exists iff the peer is indexed)
 2. Promotion of an introduced address to a verified peer keeps its history
 3. RemovePeer / RemoveByAddress orphan children instead of deleting them
 4. Unknown, duplicate or blacklisted input degrades to a no-op; nothing here
    throws for well-formed values

 Thread-safety: every public method takes one coarse mutex for its whole
 duration. Internal components are not locked separately.
*/

#include "discovery/blacklist.hpp"
#include "discovery/provenance_graph.hpp"
#include "discovery/service_index.hpp"
#include "discovery/types.hpp"
#include "discovery/verified_peer_index.hpp"

#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace overlay {
namespace discovery {

class PeerRegistry {
public:
  struct Config {
    std::vector<Address> blacklisted_addresses;  // Static exclusion list
    std::string blacklist_file;                  // Optional JSON exclusion list ("" = none)
  };

  struct Stats {
    size_t verified{0};
    size_t walkable{0};
    size_t orphaned{0};  // walkable addresses without a current introducer
    size_t edges{0};
    size_t service_entries{0};
    size_t blacklisted{0};
  };

  explicit PeerRegistry(const Config& config = Config{});

  // Non-copyable
  PeerRegistry(const PeerRegistry&) = delete;
  PeerRegistry& operator=(const PeerRegistry&) = delete;

  // === Mutations ===

  // `introducer` reported `addr`. Registers the introducer as verified and
  // records the introduction unless the address is blacklisted or already
  // has a live introducer.
  void DiscoverAddress(const VerifiedPeer& introducer, const Address& addr);

  // Union `services` into the peer's advertised set (verified or not)
  void DiscoverServices(const VerifiedPeer& peer, const ServiceSet& services);

  // Register a peer whose handshake completed
  void AddVerifiedPeer(const VerifiedPeer& peer);

  void RemovePeer(const VerifiedPeer& peer);
  void RemoveByAddress(const Address& addr);

  // === Blacklist ===

  void BlacklistAddress(const Address& addr);
  void BlacklistIdentity(const IdentityKey& key);
  bool IsBlacklisted(const Address& addr) const;
  bool LoadBlacklist(const std::string& path);

  // === Queries ===

  /**
   * Addresses known but not verified.
   *
   * service: only addresses whose direct introducer advertises it
   * older_than: only addresses whose introduction is at least this many
   *             seconds old; zero or negative means no age filter
   *
   * Ordered by address.
   */
  std::vector<Address> GetWalkableAddresses(const std::optional<ServiceId>& service = std::nullopt,
                                            std::optional<int64_t> older_than = std::nullopt) const;

  // Addresses introduced by `peer`, in introduction order
  std::vector<Address> GetIntroductionsFrom(const VerifiedPeer& peer) const;

  // Current introducer of an address (address-only or promoted)
  std::optional<IdentityKey> GetIntroducer(const Address& addr) const;

  ServiceSet GetServicesForPeer(const VerifiedPeer& peer) const;
  std::vector<VerifiedPeer> GetPeersForService(const ServiceId& service) const;

  std::optional<VerifiedPeer> GetVerifiedByAddress(const Address& addr) const;
  std::optional<VerifiedPeer> GetVerifiedByPublicKey(std::span<const uint8_t> public_key) const;
  std::optional<VerifiedPeer> GetVerifiedByKey(const IdentityKey& key) const;

  // Snapshot ordered by IdentityKey
  std::vector<VerifiedPeer> VerifiedPeers() const;
  size_t VerifiedCount() const;

  bool HasAddressNode(const Address& addr) const;
  bool HasPeerNode(const IdentityKey& key) const;

  // === Diagnostics ===

  Stats GetStats() const;
  // {verified: [...], walkable: [...], services: {key hex: [...]}, blacklisted: n}
  nlohmann::json ToJson() const;

private:
  // All *Locked helpers require mutex_ held

  // Returns true if the peer is registered after the call
  bool AddVerifiedPeerLocked(const VerifiedPeer& peer, bool check_address_blacklist);
  void RemoveIdentityLocked(const IdentityKey& key);
  std::vector<Address> IntroductionsLocked(const IdentityKey& key) const;
  bool IsWalkableLocked(const Address& addr) const;

  mutable std::mutex mutex_;
  ProvenanceGraph graph_;
  VerifiedPeerIndex verified_;
  ServiceIndex services_;
  Blacklist blacklist_;
};

}  // namespace discovery
}  // namespace overlay
