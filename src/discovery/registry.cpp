// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/registry.hpp"
#include "discovery/presence.hpp"
#include "util/time.hpp"
#include <boost/asio/ip/address.hpp>

namespace beacon {
namespace discovery {

namespace {
// Year 33658; later announcements are logged without a rendered time
constexpr double MAX_RENDERED_TIME = 1e12;
} // namespace

Registry::Registry(const DiscoveryConfig &config, ObservationSink sink)
    : broadcast_address_(ResolveBroadcastAddress(config)),
      bind_address_(boost::asio::ip::make_address(ResolveBindAddress(config))),
      port_(config.port), sink_(std::move(sink)) {}

void Registry::start(reactor::Reactor &reactor) {
  LOG_DISC_INFO("registry listening for broadcasts on {}:{} and registrations on {}:{}",
                broadcast_address_.to_string(), port_, bind_address_.to_string(),
                port_);
  reactor.spawn(listen_broadcasts(reactor), "listen_broadcasts");
  reactor.spawn(accept_connections(reactor), "accept_connections");
}

reactor::Task<void> Registry::listen_broadcasts(reactor::Reactor &reactor) {
  auto socket = reactor.create_socket<reactor::udp::socket>(reactor::udp::v4());
  socket.set_option(boost::asio::socket_base::broadcast(true));
  socket.bind(reactor::udp::endpoint(broadcast_address_, port_));
  broadcast_port_ = socket.local_endpoint().port();

  while (true) {
    auto datagram = co_await reactor.receive_from(socket);
    if (!datagram.message) {
      LOG_DISC_TRACE("dropping undecodable datagram from {}",
                     datagram.sender.address().to_string());
      continue;
    }
    record(Observation::Source::Broadcast, datagram.sender.address().to_string(),
           datagram.sender.port(), std::move(*datagram.message));
  }
}

reactor::Task<void> Registry::accept_connections(reactor::Reactor &reactor) {
  auto acceptor = reactor.create_socket<reactor::tcp::acceptor>(
      bind_address_.is_v6() ? reactor::tcp::v6() : reactor::tcp::v4());
  acceptor.bind(reactor::tcp::endpoint(bind_address_, port_));
  acceptor.listen(boost::asio::socket_base::max_listen_connections);
  listen_port_ = acceptor.local_endpoint().port();

  while (true) {
    bool failed = false;
    try {
      auto [connection, peer] = co_await reactor.accept(acceptor);
      reactor.spawn(handle_connection(reactor, std::move(connection), peer),
                    "handle_connection");
    } catch (const boost::system::system_error &e) {
      if (e.code() == boost::asio::error::operation_aborted) {
        throw;
      }
      // Transient (peer reset before accept, fd exhaustion): keep accepting
      LOG_DISC_WARN("accept failed on {}:{}: {}", bind_address_.to_string(),
                    listen_port_.load(), e.code().message());
      failed = true;
    }
    // A persistent error (EMFILE) would otherwise spin on the same failure
    if (failed) {
      co_await reactor.sleep(ACCEPT_RETRY_DELAY);
    }
  }
}

reactor::Task<void> Registry::handle_connection(reactor::Reactor &reactor,
                                                reactor::tcp::socket connection,
                                                reactor::tcp::endpoint peer) {
  auto message = co_await reactor.receive(connection);
  if (!message || codec::IsEmptyMessage(*message)) {
    LOG_DISC_TRACE("connection from {}:{} closed without a message",
                   peer.address().to_string(), peer.port());
    co_return;
  }
  record(Observation::Source::Direct, peer.address().to_string(), peer.port(),
         std::move(*message));
}

void Registry::record(Observation::Source source, const std::string &address,
                      uint16_t port, codec::Message message) {
  ++observation_count_;

  const int64_t received_at = util::GetTime();
  const std::string body = message.dump(-1, ' ', false,
                                        codec::Message::error_handler_t::replace);
  if (source == Observation::Source::Broadcast) {
    LOG_DISC_INFO("discover: {} > {}", address, body);
  } else {
    LOG_DISC_INFO("handle: {}:{} > {}", address, port, body);
  }

  const auto announced = PresenceTime(message);
  // Range check keeps the conversion to whole seconds defined
  if (announced && *announced >= 0.0 && *announced < MAX_RENDERED_TIME) {
    LOG_DISC_DEBUG("{} announced at {}, received at {}", address,
                   util::FormatTime(static_cast<int64_t>(*announced)),
                   util::FormatTime(received_at));
  }

  if (!sink_) {
    return;
  }
  // A faulty sink must not end the listener that delivered the observation
  try {
    sink_(Observation{source, address, port, std::move(message), received_at});
  } catch (const std::exception &e) {
    LOG_DISC_ERROR("observation sink failed for {}:{}: {}", address, port, e.what());
  }
}

} // namespace discovery
} // namespace beacon
