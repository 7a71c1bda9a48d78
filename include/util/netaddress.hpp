#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Parse IPv4 CIDR subnets and derive their broadcast address

 Key functions:
 - ValidateAndNormalizeIP: Validates address format and normalizes (IPv4-mapped -> IPv4)
 - IsValidIPAddress: Quick check if address string is valid
 - ParseSubnet: "192.168.1.0/24" -> Subnet
*/

#include <boost/asio/ip/address_v4.hpp>
#include <optional>
#include <string>

namespace beacon {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps boost::asio::ip::make_address() and normalizes IPv4-mapped IPv6
 * addresses to IPv4 so "::ffff:10.0.0.5" and "10.0.0.5" compare equal.
 * Hostnames are rejected (only numeric IPs accepted).
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Check if a string is a valid IP address
 */
bool IsValidIPAddress(const std::string& address);

/**
 * IPv4 network in CIDR form
 */
struct Subnet {
  boost::asio::ip::address_v4 network;
  unsigned prefix_length = 0;

  // Highest address of the range (the subnet broadcast address)
  boost::asio::ip::address_v4 broadcast() const;
};

/**
 * Parse an IPv4 CIDR string
 *
 * Strict: host bits must be zero ("10.0.0.1/24" is rejected). A bare address
 * without a prefix is treated as /32. IPv6 networks are rejected because they
 * have no broadcast address.
 *
 * Examples:
 *   "10.0.0.0/24" -> {10.0.0.0, 24}, broadcast 10.0.0.255
 *   "127.0.0.1"   -> {127.0.0.1, 32}, broadcast 127.0.0.1
 *   "10.0.0.0/33" -> std::nullopt
 */
std::optional<Subnet> ParseSubnet(const std::string& cidr);

} // namespace util
} // namespace beacon
