// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Discovery value types

 - Address: (host, port) endpoint, compared and hashed by value
 - IdentityKey: 20-byte public key fingerprint of a verified peer
 - ServiceId: 20-byte opaque capability identifier
 - VerifiedPeer: peer whose identity was established by the handshake layer

 IdentityKey values are produced by the crypto subsystem; nothing in this
 library derives or checks them.
*/

#include <algorithm>
#include <array>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace overlay {
namespace discovery {

namespace detail {
std::string EncodeHex(std::span<const uint8_t> bytes);
bool DecodeHex(const std::string& hex, std::span<uint8_t> out);
}  // namespace detail

/**
 * FixedBytes - fixed-width opaque byte string
 *
 * Tag keeps IdentityKey and ServiceId distinct types with the same layout.
 */
template <size_t N, typename Tag>
class FixedBytes {
public:
  static constexpr size_t SIZE = N;

  FixedBytes() { data_.fill(0); }
  explicit FixedBytes(const std::array<uint8_t, N>& bytes) : data_(bytes) {}

  static std::optional<FixedBytes> FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != N) {
      return std::nullopt;
    }
    FixedBytes result;
    std::copy(bytes.begin(), bytes.end(), result.data_.begin());
    return result;
  }

  static std::optional<FixedBytes> FromHex(const std::string& hex) {
    FixedBytes result;
    if (!detail::DecodeHex(hex, result.data_)) {
      return std::nullopt;
    }
    return result;
  }

  std::string ToHex() const { return detail::EncodeHex(data_); }

  const std::array<uint8_t, N>& bytes() const { return data_; }

  bool IsNull() const {
    return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
  }

  auto operator<=>(const FixedBytes&) const = default;
  bool operator==(const FixedBytes&) const = default;

private:
  std::array<uint8_t, N> data_;
};

struct IdentityKeyTag {};
struct ServiceIdTag {};

using IdentityKey = FixedBytes<20, IdentityKeyTag>;
using ServiceId = FixedBytes<20, ServiceIdTag>;
using ServiceSet = std::set<ServiceId>;

// Network endpoint
struct Address {
  std::string host;
  uint16_t port{0};

  Address() = default;
  Address(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

  // Parse "IP:port" or "[IPv6]:port". The host is normalized (IPv4-mapped
  // IPv6 collapses to IPv4). Returns nullopt on malformed input.
  static std::optional<Address> Parse(const std::string& endpoint);

  // "host:port", or "[host]:port" for IPv6
  std::string ToString() const;

  auto operator<=>(const Address&) const = default;
  bool operator==(const Address&) const = default;
};

/**
 * VerifiedPeer - a remote peer whose identity the handshake layer established
 *
 * Registry identity is the IdentityKey only. The address may change over the
 * lifetime of the peer; the clock and last_seen fields are protocol state the
 * registry carries along but never interprets.
 */
struct VerifiedPeer {
  std::vector<uint8_t> public_key;
  IdentityKey key;
  Address address;
  uint64_t lamport_clock{0};
  int64_t last_seen{0};

  VerifiedPeer() = default;
  VerifiedPeer(std::vector<uint8_t> pk, const IdentityKey& k, Address addr)
      : public_key(std::move(pk)), key(k), address(std::move(addr)) {}

  // Advance the lamport clock to at least `timestamp`
  void UpdateClock(uint64_t timestamp) { lamport_clock = std::max(lamport_clock, timestamp); }

  // Same peer for registry purposes
  bool operator==(const VerifiedPeer& other) const { return key == other.key; }
};

}  // namespace discovery
}  // namespace overlay

namespace std {

template <>
struct hash<overlay::discovery::Address> {
  size_t operator()(const overlay::discovery::Address& addr) const noexcept {
    size_t h = std::hash<std::string>{}(addr.host);
    return h ^ (static_cast<size_t>(addr.port) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
  }
};

template <size_t N, typename Tag>
struct hash<overlay::discovery::FixedBytes<N, Tag>> {
  size_t operator()(const overlay::discovery::FixedBytes<N, Tag>& id) const noexcept {
    // Fingerprints are already uniformly distributed; fold the leading bytes
    size_t h = 0;
    for (size_t i = 0; i < sizeof(size_t) && i < N; ++i) {
      h = (h << 8) | id.bytes()[i];
    }
    return h;
  }
};

}  // namespace std
