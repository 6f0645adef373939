// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/types.hpp"

#include "util/netaddress.hpp"

namespace overlay {
namespace discovery {

namespace detail {

std::string EncodeHex(std::span<const uint8_t> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    out.push_back(kDigits[b >> 4]);
    out.push_back(kDigits[b & 0x0f]);
  }
  return out;
}

static int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool DecodeHex(const std::string& hex, std::span<uint8_t> out) {
  if (hex.size() != out.size() * 2) {
    return false;
  }
  for (size_t i = 0; i < out.size(); ++i) {
    int hi = HexValue(hex[2 * i]);
    int lo = HexValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return true;
}

}  // namespace detail

std::optional<Address> Address::Parse(const std::string& endpoint) {
  std::string ip;
  uint16_t port = 0;
  if (!util::ParseIPPort(endpoint, ip, port)) {
    return std::nullopt;
  }
  return Address(std::move(ip), port);
}

std::string Address::ToString() const {
  if (util::IsIPv6(host)) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

}  // namespace discovery
}  // namespace overlay
