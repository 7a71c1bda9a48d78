// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "codec/message_codec.hpp"
#include "reactor/readiness.hpp"
#include "util/logging.hpp"
#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace beacon {
namespace reactor {

// Unit of cooperative work scheduled on a Reactor
template <typename T = void>
using Task = boost::asio::awaitable<T>;

using tcp = boost::asio::ip::tcp;
using udp = boost::asio::ip::udp;

// Result of receive_from(): message is std::nullopt when the datagram did not decode
template <typename Endpoint>
struct Datagram {
  std::optional<codec::Message> message;
  Endpoint sender;
};

/**
 * Reactor - single-threaded cooperative scheduler over non-blocking sockets
 *
 * Owns one io_context. Tasks are coroutines spawned with spawn(); each
 * suspending operation (accept, connect, receive, send, receive_from, send_to,
 * sleep) registers a cancel hook for the duration of its wait so shutdown()
 * can wake every task with operation_aborted.
 *
 * receive_from()/send_to() are readiness-driven: the non-blocking call is tried
 * immediately, and on would_block the Reactor watches the socket and retries
 * once it is ready (see AsyncRetryUntilReady). The Reactor is the only place
 * readiness callbacks are registered; at most one watch exists per socket and
 * direction, and a new watch replaces a stale one.
 *
 * Threading: everything except stop(), force_stop() and the counters must be
 * called on the thread running the io_context.
 */
class Reactor {
public:
  using Clock = std::chrono::steady_clock;

  // Upper bound on scheduler passes spent waiting for cancelled tasks to unwind
  static constexpr size_t MAX_DRAIN_PASSES = 8;

  explicit Reactor(std::shared_ptr<const codec::MessageCodec> codec = codec::DefaultCodec());
  ~Reactor();

  Reactor(const Reactor &) = delete;
  Reactor &operator=(const Reactor &) = delete;

  boost::asio::io_context &io_context() { return *io_context_; }
  boost::asio::any_io_executor executor() { return io_context_->get_executor(); }
  const codec::MessageCodec &codec() const { return *codec_; }

  // Open a non-blocking socket (udp::socket, tcp::socket or tcp::acceptor)
  // with SO_REUSEADDR. Throws boost::system::system_error on failure.
  template <typename Socket>
  Socket create_socket(const typename Socket::protocol_type &protocol);

  Task<std::pair<tcp::socket, tcp::endpoint>> accept(tcp::acceptor &acceptor);

  Task<void> connect(tcp::socket &socket, const tcp::endpoint &endpoint);

  // Read up to MAX_PACKET_SIZE bytes and decode them. std::nullopt when the
  // peer closed the connection or the bytes did not decode.
  Task<std::optional<codec::Message>> receive(tcp::socket &socket);

  // Write the whole encoded message; returns bytes written
  Task<size_t> send(tcp::socket &socket, const codec::Message &message);

  template <typename DatagramSocket>
  Task<Datagram<typename DatagramSocket::endpoint_type>>
  receive_from(DatagramSocket &socket);

  // Empty messages (see codec::IsEmptyMessage) return 0 without touching the socket
  template <typename DatagramSocket>
  Task<size_t> send_to(DatagramSocket &socket, const codec::Message &message,
                       const typename DatagramSocket::endpoint_type &destination);

  Task<void> sleep(Clock::duration duration);

  // Schedule a task. Failures are logged and contained to the task.
  void spawn(Task<void> task, std::string name);

  // Register a one-shot readiness callback for `socket`, replacing any
  // callback already registered for the same socket and direction.
  template <typename Socket>
  void watch(Socket &socket, Direction direction, ReadyCallback on_ready);

  // Invoked on the reactor thread when the last running task exits while the
  // reactor is not shutting down
  void set_idle_handler(std::function<void()> handler) {
    idle_handler_ = std::move(handler);
  }

  // Run the loop until stop()
  void run();

  // Thread-safe: make run() return
  void stop();

  // Cancel every task, drain until they unwind, release scheduler state.
  // Idempotent; also invoked by the destructor.
  void shutdown();

  // Thread-safe: abandon an in-progress shutdown drain
  void force_stop();

  size_t active_tasks() const { return active_tasks_.load(); }
  size_t pending_watches() const { return watchers_.size(); }
  size_t drain_passes() const { return drain_passes_; }
  bool is_shutting_down() const { return stopping_.load(); }
  bool is_shut_down() const { return shut_down_.load(); }

private:
  using WatchKey = std::pair<int64_t, Direction>;

  struct Watcher {
    uint64_t generation = 0;
    ReadyCallback callback;
    std::function<void()> cancel;
  };

  // Keeps a cancel hook registered while a suspending call is in flight
  class PendingScope {
  public:
    PendingScope(Reactor &reactor, uint64_t id) : reactor_(reactor), id_(id) {}
    ~PendingScope() { reactor_.pending_.erase(id_); }

    PendingScope(const PendingScope &) = delete;
    PendingScope &operator=(const PendingScope &) = delete;

  private:
    Reactor &reactor_;
    uint64_t id_;
  };

  PendingScope track(std::function<void()> cancel);
  void throw_if_stopping() const;
  void fire(const WatchKey &key, uint64_t generation,
            const boost::system::error_code &ec);
  void cancel_all();
  void on_task_exit(const std::string &name, std::exception_ptr error);
  void log_task_exit(const std::string &name, std::exception_ptr error);

  // NOTE: io_context_ is a unique_ptr so ~Reactor() can destroy it (and any
  // abandoned task frames it still holds) while the registries below are
  // still alive.
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<const codec::MessageCodec> codec_;

  std::map<WatchKey, Watcher> watchers_;
  std::map<uint64_t, std::function<void()>> pending_;
  uint64_t next_id_ = 0;
  std::function<void()> idle_handler_;

  std::atomic<size_t> active_tasks_{0};
  std::atomic<bool> stopping_{false};
  std::atomic<bool> shut_down_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> force_stop_{false};
  size_t drain_passes_ = 0;
};

// ============================================================================
// Template implementation
// ============================================================================

template <typename Socket>
Socket Reactor::create_socket(const typename Socket::protocol_type &protocol) {
  Socket socket(*io_context_);
  socket.open(protocol);
  socket.non_blocking(true);
  // Allow rebinding a port that was not closed cleanly
  socket.set_option(boost::asio::socket_base::reuse_address(true));
  return socket;
}

template <typename Socket>
void Reactor::watch(Socket &socket, Direction direction, ReadyCallback on_ready) {
  if (stopping_) {
    boost::asio::post(*io_context_, [callback = std::move(on_ready)]() {
      callback(boost::asio::error::operation_aborted);
    });
    return;
  }

  const WatchKey key{static_cast<int64_t>(socket.native_handle()), direction};
  const uint64_t generation = ++next_id_;

  Watcher &watcher = watchers_[key];
  if (watcher.callback) {
    // The stale wait may still complete; fire() drops it by generation
    LOG_NET_TRACE("replacing stale {} watch on socket {}",
                  direction == Direction::Read ? "read" : "write", key.first);
  }
  watcher.generation = generation;
  watcher.callback = std::move(on_ready);
  watcher.cancel = [&socket]() {
    boost::system::error_code ignored;
    socket.cancel(ignored);
  };

  socket.async_wait(direction == Direction::Read
                        ? boost::asio::socket_base::wait_read
                        : boost::asio::socket_base::wait_write,
                    [this, key, generation](const boost::system::error_code &ec) {
                      fire(key, generation, ec);
                    });
}

template <typename DatagramSocket>
Task<Datagram<typename DatagramSocket::endpoint_type>>
Reactor::receive_from(DatagramSocket &socket) {
  throw_if_stopping();

  std::vector<uint8_t> buffer(codec::MAX_PACKET_SIZE);
  typename DatagramSocket::endpoint_type sender;

  const size_t received = co_await AsyncRetryUntilReady<size_t>(
      executor(),
      [&socket, &buffer, &sender]() {
        boost::system::error_code ec;
        const size_t n = socket.receive_from(boost::asio::buffer(buffer), sender, 0, ec);
        return IoResult<size_t>::FromOutcome(n, ec);
      },
      [this, &socket](ReadyCallback on_ready) {
        watch(socket, Direction::Read, std::move(on_ready));
      },
      boost::asio::use_awaitable);

  co_return Datagram<typename DatagramSocket::endpoint_type>{
      codec_->decode(buffer.data(), received), sender};
}

template <typename DatagramSocket>
Task<size_t>
Reactor::send_to(DatagramSocket &socket, const codec::Message &message,
                 const typename DatagramSocket::endpoint_type &destination) {
  if (codec::IsEmptyMessage(message)) {
    co_return 0;
  }
  throw_if_stopping();

  const std::vector<uint8_t> packet = codec_->encode(message);

  co_return co_await AsyncRetryUntilReady<size_t>(
      executor(),
      [&socket, &packet, &destination]() {
        boost::system::error_code ec;
        const size_t n = socket.send_to(boost::asio::buffer(packet), destination, 0, ec);
        return IoResult<size_t>::FromOutcome(n, ec);
      },
      [this, &socket](ReadyCallback on_ready) {
        watch(socket, Direction::Write, std::move(on_ready));
      },
      boost::asio::use_awaitable);
}

} // namespace reactor
} // namespace beacon
