// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/provenance_graph.hpp"

#include <algorithm>

namespace overlay {
namespace discovery {

bool ProvenanceGraph::HasEdge(const NodeKey& from, const NodeKey& to) const {
  auto it = parents_.find(to);
  return it != parents_.end() && it->second == from;
}

bool ProvenanceGraph::AddNode(const NodeKey& key) {
  return nodes_.try_emplace(key).second;
}

bool ProvenanceGraph::AddEdge(const NodeKey& from, const NodeKey& to, int64_t now) {
  if (from == to) {
    return false;
  }
  auto from_it = nodes_.find(from);
  auto to_it = nodes_.find(to);
  if (from_it == nodes_.end() || to_it == nodes_.end()) {
    return false;
  }
  if (parents_.count(to) > 0) {
    return false;
  }
  from_it->second.children.push_back(to);
  to_it->second.introduced_at = now;
  parents_.emplace(to, from);
  return true;
}

void ProvenanceGraph::DetachFromParent(const NodeKey& key) {
  auto parent_it = parents_.find(key);
  if (parent_it == parents_.end()) {
    return;
  }
  auto node_it = nodes_.find(parent_it->second);
  if (node_it != nodes_.end()) {
    auto& siblings = node_it->second.children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), key), siblings.end());
  }
  parents_.erase(parent_it);
}

bool ProvenanceGraph::RemoveNode(const NodeKey& key) {
  auto it = nodes_.find(key);
  if (it == nodes_.end()) {
    return false;
  }
  // Orphan the children
  for (const auto& child : it->second.children) {
    parents_.erase(child);
  }
  DetachFromParent(key);
  nodes_.erase(it);
  return true;
}

bool ProvenanceGraph::Absorb(const Address& addr, const IdentityKey& key) {
  const NodeKey addr_key{addr};
  const NodeKey peer_key{key};

  auto addr_it = nodes_.find(addr_key);
  if (addr_it == nodes_.end()) {
    return false;
  }
  auto& peer = nodes_.try_emplace(peer_key).first->second;
  Node absorbed = std::move(addr_it->second);

  // Outgoing edges move over, keeping their order
  for (auto& child : absorbed.children) {
    if (child == peer_key) {
      parents_.erase(peer_key);
      continue;
    }
    parents_[child] = peer_key;
    peer.children.push_back(std::move(child));
  }

  // Incoming edge
  auto parent_it = parents_.find(addr_key);
  if (parent_it != parents_.end()) {
    NodeKey parent = parent_it->second;
    parents_.erase(parent_it);
    auto& siblings = nodes_.at(parent).children;
    auto pos = std::find(siblings.begin(), siblings.end(), addr_key);
    if (parent != peer_key && parents_.count(peer_key) == 0) {
      // Inherit the introducer in place so introduction order is unchanged
      if (pos != siblings.end()) {
        *pos = peer_key;
      }
      parents_.emplace(peer_key, parent);
      peer.introduced_at = absorbed.introduced_at;
    } else if (pos != siblings.end()) {
      siblings.erase(pos);
    }
  }

  nodes_.erase(addr_key);
  return true;
}

std::optional<ProvenanceGraph::NodeKey> ProvenanceGraph::GetParent(const NodeKey& key) const {
  auto it = parents_.find(key);
  if (it == parents_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<ProvenanceGraph::NodeKey> ProvenanceGraph::GetChildren(const NodeKey& key) const {
  auto it = nodes_.find(key);
  if (it == nodes_.end()) {
    return {};
  }
  return it->second.children;
}

const ProvenanceGraph::Node* ProvenanceGraph::Find(const NodeKey& key) const {
  auto it = nodes_.find(key);
  return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<Address> ProvenanceGraph::AddressNodes() const {
  std::vector<Address> result;
  // std::variant orders by index first, so Address keys form a prefix of nodes_
  for (const auto& [key, node] : nodes_) {
    const auto* addr = std::get_if<Address>(&key);
    if (!addr) {
      break;
    }
    result.push_back(*addr);
  }
  return result;
}

}  // namespace discovery
}  // namespace overlay
