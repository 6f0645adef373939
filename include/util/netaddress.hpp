// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings before they reach the registry
 - Parse "IP:port" endpoints reported by introductions and exclusion lists

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - ParseIPPort: Splits "IP:port" / "[IPv6]:port" into normalized components
*/

#include <cstdint>
#include <optional>
#include <string>

namespace overlay {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps asio::ip::make_address() and collapses IPv4-mapped IPv6 addresses to
 * plain IPv4, so "::ffff:1.2.3.4" and "1.2.3.4" name the same endpoint.
 * Hostnames are rejected; only numeric IPs are accepted.
 *
 * @return Normalized IP address string, or std::nullopt if invalid
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

// Check if the normalized address is IPv6 (used for "[v6]:port" rendering)
bool IsIPv6(const std::string& address);

/**
 * Parse a decimal port number. Rejects signs, whitespace, trailing characters
 * and values outside 1..65535.
 */
std::optional<uint16_t> ParsePort(const std::string& port_str);

/**
 * Parse "IP:port" string into separate IP and port components
 *
 * Supports both IPv4 and IPv6 formats:
 * - IPv4: "192.168.1.1:8090"
 * - IPv6: "[2001:db8::1]:8090"
 *
 * Unbracketed IPv6 is rejected because the port cannot be located reliably.
 *
 * @return true if successfully parsed, false otherwise
 */
bool ParseIPPort(const std::string& address_port, std::string& out_ip, uint16_t& out_port);

}  // namespace util
}  // namespace overlay
