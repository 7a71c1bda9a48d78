// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/advertiser.hpp"
#include "discovery/presence.hpp"
#include "util/time.hpp"

namespace beacon {
namespace discovery {

Advertiser::Advertiser(const DiscoveryConfig &config)
    : destination_(ResolveBroadcastAddress(config), config.port),
      interval_(config.interval) {
  if (config.port == 0) {
    throw ConfigError("advertiser needs a non-zero port");
  }
  if (interval_.count() <= 0) {
    throw ConfigError("announce interval must be positive");
  }
}

void Advertiser::start(reactor::Reactor &reactor) {
  LOG_DISC_INFO("advertising presence to {}:{} every {} ms",
                destination_.address().to_string(), destination_.port(),
                interval_.count());
  reactor.spawn(advertise(reactor), "advertise");
}

reactor::Task<void> Advertiser::advertise(reactor::Reactor &reactor) {
  auto socket = reactor.create_socket<reactor::udp::socket>(reactor::udp::v4());
  socket.set_option(boost::asio::socket_base::broadcast(true));

  while (true) {
    try {
      co_await reactor.send_to(socket, MakePresence(util::GetTimeSeconds()), destination_);
      ++announcements_sent_;
    } catch (const boost::system::system_error &e) {
      if (e.code() == boost::asio::error::operation_aborted) {
        throw;
      }
      LOG_DISC_WARN("presence announcement to {}:{} failed: {}",
                    destination_.address().to_string(), destination_.port(),
                    e.code().message());
    }

    co_await reactor.sleep(interval_);
  }
}

} // namespace discovery
} // namespace beacon
