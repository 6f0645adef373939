// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 ProvenanceGraph — directed "who introduced whom" graph

 Purpose
 - Record address-only entries (heard about, not verified) and verified-peer
   entries as nodes, and "u introduced v" as directed edges
 - Keep introduction order per introducer
 - Move an address-only node's history onto a verified-peer node (promotion)

 Representation
 - nodes_: node key -> record with the ordered outgoing-edge list
 - parents_: target key -> its single current introducer

 Invariants
 - At most one node per Address and per IdentityKey
 - Every key in parents_ (and its value) is a key of nodes_
 - v appears in nodes_[u].children iff parents_[v] == u
 - Removing a node never removes another node

 Not thread-safe; PeerRegistry serializes access.
*/

#include "discovery/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <variant>
#include <vector>

namespace overlay {
namespace discovery {

class ProvenanceGraph {
public:
  using NodeKey = std::variant<Address, IdentityKey>;

  struct Node {
    std::vector<NodeKey> children;  // introduction order
    int64_t introduced_at{0};       // when the current parent edge was added
  };

  ProvenanceGraph() = default;

  bool HasNode(const NodeKey& key) const { return nodes_.count(key) > 0; }
  bool HasAddressNode(const Address& addr) const { return HasNode(NodeKey{addr}); }
  bool HasPeerNode(const IdentityKey& key) const { return HasNode(NodeKey{key}); }

  bool HasEdge(const NodeKey& from, const NodeKey& to) const;

  // Returns false if the node already exists
  bool AddNode(const NodeKey& key);

  // Add from -> to. Both nodes must exist and `to` must have no parent.
  // Returns false (and changes nothing) otherwise, or for a self-loop.
  bool AddEdge(const NodeKey& from, const NodeKey& to, int64_t now);

  // Remove the node and every edge touching it. Children become parentless.
  // Returns false if the node does not exist.
  bool RemoveNode(const NodeKey& key);

  /**
   * Fold the AddressNode `addr` into the PeerNode `key`, creating the PeerNode
   * if absent. Outgoing edges are appended to the peer's list. The address's
   * introducer is inherited when the peer has none; otherwise that edge is
   * dropped. Returns false if no AddressNode exists for `addr`.
   */
  bool Absorb(const Address& addr, const IdentityKey& key);

  std::optional<NodeKey> GetParent(const NodeKey& key) const;

  // Children of `key` in insertion order (empty if unknown)
  std::vector<NodeKey> GetChildren(const NodeKey& key) const;

  const Node* Find(const NodeKey& key) const;

  // All AddressNode keys, ordered by address
  std::vector<Address> AddressNodes() const;

  size_t NodeCount() const { return nodes_.size(); }
  size_t EdgeCount() const { return parents_.size(); }

private:
  void DetachFromParent(const NodeKey& key);

  std::map<NodeKey, Node> nodes_;
  std::map<NodeKey, NodeKey> parents_;
};

}  // namespace discovery
}  // namespace overlay
