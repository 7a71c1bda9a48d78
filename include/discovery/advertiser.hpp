// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/config.hpp"
#include "discovery/role.hpp"
#include "reactor/reactor.hpp"
#include <atomic>
#include <cstdint>

namespace beacon {
namespace discovery {

/**
 * Advertiser - announces this node's presence on the subnet
 *
 * One task: a UDP socket with SO_BROADCAST sends {"time": now} to
 * (subnet broadcast address, port) every `interval`. The loop ends only when
 * the reactor cancels it; a failed send is logged and retried next interval.
 */
class Advertiser : public Role {
public:
  /**
   * @throws ConfigError if config.subnet is malformed
   */
  explicit Advertiser(const DiscoveryConfig &config);

  std::string name() const override { return "advertiser"; }
  void start(reactor::Reactor &reactor) override;

  const reactor::udp::endpoint &destination() const { return destination_; }
  std::chrono::milliseconds interval() const { return interval_; }

  // Presence datagrams handed to the kernel so far
  uint64_t announcements_sent() const { return announcements_sent_.load(); }

private:
  reactor::Task<void> advertise(reactor::Reactor &reactor);

  reactor::udp::endpoint destination_;
  std::chrono::milliseconds interval_;
  std::atomic<uint64_t> announcements_sent_{0};
};

} // namespace discovery
} // namespace beacon
