// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/config.hpp"
#include "discovery/role.hpp"
#include "reactor/reactor.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace beacon {
namespace discovery {

// A presence message seen by the registry
struct Observation {
  enum class Source { Broadcast, Direct };

  Source source;
  std::string address;
  uint16_t port;
  codec::Message message;
  int64_t received_at = 0; // unix seconds (util::GetTime)
};

using ObservationSink = std::function<void(const Observation &)>;

/**
 * Registry - records the nodes that announce or register themselves
 *
 * Two tasks share the configured port:
 *   - listen_broadcasts: UDP socket bound to (subnet broadcast address, port);
 *     every datagram that decodes is recorded as a Broadcast observation
 *   - accept_connections: TCP listener on (bind_address, port); each accepted
 *     connection gets its own task that reads one message, records it as a
 *     Direct observation and closes without replying
 *
 * Observations are logged; the optional sink sees them on the reactor thread.
 * An exception thrown by the sink is logged and does not stop the listener.
 * Undecodable input is dropped silently.
 */
class Registry : public Role {
public:
  // Pause after a failed accept before trying again
  static constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

  /**
   * @throws ConfigError if config.subnet or config.bind_address is malformed
   */
  explicit Registry(const DiscoveryConfig &config, ObservationSink sink = {});

  std::string name() const override { return "registry"; }
  void start(reactor::Reactor &reactor) override;

  // Ports actually bound (differ from config.port when it is 0); 0 until bound
  uint16_t broadcast_port() const { return broadcast_port_.load(); }
  uint16_t listen_port() const { return listen_port_.load(); }

  uint64_t observation_count() const { return observation_count_.load(); }

private:
  reactor::Task<void> listen_broadcasts(reactor::Reactor &reactor);
  reactor::Task<void> accept_connections(reactor::Reactor &reactor);
  reactor::Task<void> handle_connection(reactor::Reactor &reactor,
                                        reactor::tcp::socket connection,
                                        reactor::tcp::endpoint peer);

  void record(Observation::Source source, const std::string &address,
              uint16_t port, codec::Message message);

  boost::asio::ip::address_v4 broadcast_address_;
  boost::asio::ip::address bind_address_;
  uint16_t port_;
  ObservationSink sink_;

  std::atomic<uint16_t> broadcast_port_{0};
  std::atomic<uint16_t> listen_port_{0};
  std::atomic<uint64_t> observation_count_{0};
};

} // namespace discovery
} // namespace beacon
