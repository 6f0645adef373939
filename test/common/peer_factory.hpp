// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Deterministic peers, addresses and services for registry tests

#pragma once

#include "discovery/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace overlay {
namespace test {

inline discovery::Address MakeAddress(uint32_t n, uint16_t port = 8090) {
  return discovery::Address("93.184." + std::to_string((n >> 8) & 0xFF) + "." + std::to_string(n & 0xFF), port);
}

inline discovery::IdentityKey MakeKey(uint32_t n) {
  std::array<uint8_t, discovery::IdentityKey::SIZE> bytes{};
  bytes[0] = 0xA5;
  bytes[16] = static_cast<uint8_t>(n >> 24);
  bytes[17] = static_cast<uint8_t>(n >> 16);
  bytes[18] = static_cast<uint8_t>(n >> 8);
  bytes[19] = static_cast<uint8_t>(n);
  return discovery::IdentityKey(bytes);
}

inline std::vector<uint8_t> MakePublicKey(uint32_t n) {
  std::vector<uint8_t> pk(33, 0x02);
  pk[29] = static_cast<uint8_t>(n >> 24);
  pk[30] = static_cast<uint8_t>(n >> 16);
  pk[31] = static_cast<uint8_t>(n >> 8);
  pk[32] = static_cast<uint8_t>(n);
  return pk;
}

// Peer n lives at MakeAddress(n)
inline discovery::VerifiedPeer MakePeer(uint32_t n) {
  return discovery::VerifiedPeer(MakePublicKey(n), MakeKey(n), MakeAddress(n));
}

// 20 bytes starting at `first`, counting up (first=0 gives 00 01 .. 13)
inline discovery::ServiceId MakeService(uint8_t first) {
  std::array<uint8_t, discovery::ServiceId::SIZE> bytes{};
  for (size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] = static_cast<uint8_t>(first + i);
  }
  return discovery::ServiceId(bytes);
}

}  // namespace test
}  // namespace overlay
