// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/asio/ip/address_v4.hpp>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace beacon {

// Invalid role configuration, raised before any socket is created
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

namespace discovery {

// Default cadence of presence announcements
constexpr std::chrono::milliseconds DEFAULT_ANNOUNCE_INTERVAL{1000};

// Default address of the registry's TCP listener
constexpr const char *DEFAULT_BIND_ADDRESS = "127.0.0.1";

struct DiscoveryConfig {
  // IPv4 CIDR whose broadcast address carries presence datagrams
  std::string subnet;

  // Shared by the UDP discovery channel and the registry TCP listener.
  // 0 binds an ephemeral port (tests).
  uint16_t port = 0;

  // Registry TCP listener address
  std::string bind_address = DEFAULT_BIND_ADDRESS;

  // Advertiser cadence
  std::chrono::milliseconds interval = DEFAULT_ANNOUNCE_INTERVAL;
};

/**
 * Broadcast address of config.subnet
 * @throws ConfigError if the subnet is malformed
 */
boost::asio::ip::address_v4 ResolveBroadcastAddress(const DiscoveryConfig &config);

/**
 * Validated registry TCP bind address
 * @throws ConfigError if bind_address is not a numeric IP
 */
std::string ResolveBindAddress(const DiscoveryConfig &config);

} // namespace discovery
} // namespace beacon
