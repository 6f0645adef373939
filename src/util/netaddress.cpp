// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include "util/logging.hpp"

#include <charconv>

#include <asio/ip/address.hpp>

namespace overlay {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    asio::error_code ec;
    auto ip = asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    // Example: ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = asio::ip::make_address_v4(asio::ip::v4_mapped, ip.to_v6());
      return v4.to_string();
    }

    return ip.to_string();

  } catch (const std::exception& e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

bool IsIPv6(const std::string& address) {
  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  return !ec && ip.is_v6() && !ip.to_v6().is_v4_mapped();
}

std::optional<uint16_t> ParsePort(const std::string& port_str) {
  if (port_str.empty() || port_str.size() > 5) {
    return std::nullopt;
  }
  uint32_t value = 0;
  const char* first = port_str.data();
  const char* last = port_str.data() + port_str.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last || value == 0 || value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(value);
}

bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port) {
  if (address_port.empty()) {
    return false;
  }

  std::string ip;
  std::string port_str;

  // IPv6 format: "[IPv6]:port"
  if (address_port[0] == '[') {
    size_t bracket_end = address_port.find(']');
    if (bracket_end == std::string::npos || bracket_end < 2) {
      return false;  // Missing closing bracket or empty brackets
    }
    if (bracket_end + 1 >= address_port.length() || address_port[bracket_end + 1] != ':') {
      return false;  // Missing :port
    }
    ip = address_port.substr(1, bracket_end - 1);
    port_str = address_port.substr(bracket_end + 2);
  } else {
    // IPv4 format: "IP:port"
    size_t first_colon = address_port.find(':');
    if (first_colon == std::string::npos) {
      return false;
    }
    // Multiple colons means unbracketed IPv6, which is ambiguous
    if (address_port.find(':', first_colon + 1) != std::string::npos) {
      return false;
    }
    ip = address_port.substr(0, first_colon);
    port_str = address_port.substr(first_colon + 1);
  }

  auto port = ParsePort(port_str);
  if (!port) {
    return false;
  }
  auto normalized = ValidateAndNormalizeIP(ip);
  if (!normalized) {
    return false;
  }

  out_ip = *normalized;
  out_port = *port;
  return true;
}

}  // namespace util
}  // namespace overlay
