// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/config.hpp"
#include "util/netaddress.hpp"

namespace beacon {
namespace discovery {

boost::asio::ip::address_v4 ResolveBroadcastAddress(const DiscoveryConfig &config) {
  auto subnet = util::ParseSubnet(config.subnet);
  if (!subnet) {
    throw ConfigError("invalid subnet '" + config.subnet +
                      "' (expected IPv4 CIDR such as 192.168.1.0/24)");
  }
  return subnet->broadcast();
}

std::string ResolveBindAddress(const DiscoveryConfig &config) {
  auto normalized = util::ValidateAndNormalizeIP(config.bind_address);
  if (!normalized) {
    throw ConfigError("invalid bind address '" + config.bind_address + "'");
  }
  return *normalized;
}

} // namespace discovery
} // namespace beacon
