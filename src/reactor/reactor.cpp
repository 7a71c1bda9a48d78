// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "reactor/reactor.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>

namespace beacon {
namespace reactor {

Reactor::Reactor(std::shared_ptr<const codec::MessageCodec> codec)
    : io_context_(std::make_unique<boost::asio::io_context>(1)),
      codec_(codec ? std::move(codec) : codec::DefaultCodec()) {}

Reactor::~Reactor() {
  shutdown();

  // Drop socket references held by watch cancel hooks before abandoned task
  // frames (and the sockets they own) are destroyed with the io_context.
  watchers_.clear();
  io_context_.reset();
}

Reactor::PendingScope Reactor::track(std::function<void()> cancel) {
  const uint64_t id = ++next_id_;
  pending_.emplace(id, std::move(cancel));
  return PendingScope(*this, id);
}

void Reactor::throw_if_stopping() const {
  if (stopping_) {
    throw boost::system::system_error(boost::asio::error::operation_aborted);
  }
}

Task<std::pair<tcp::socket, tcp::endpoint>>
Reactor::accept(tcp::acceptor &acceptor) {
  throw_if_stopping();
  auto scope = track([&acceptor]() {
    boost::system::error_code ignored;
    acceptor.cancel(ignored);
  });

  tcp::endpoint peer;
  tcp::socket connection =
      co_await acceptor.async_accept(peer, boost::asio::use_awaitable);
  connection.non_blocking(true);

  co_return std::make_pair(std::move(connection), peer);
}

Task<void> Reactor::connect(tcp::socket &socket, const tcp::endpoint &endpoint) {
  throw_if_stopping();
  auto scope = track([&socket]() {
    boost::system::error_code ignored;
    socket.cancel(ignored);
  });

  co_await socket.async_connect(endpoint, boost::asio::use_awaitable);
}

Task<std::optional<codec::Message>> Reactor::receive(tcp::socket &socket) {
  throw_if_stopping();
  auto scope = track([&socket]() {
    boost::system::error_code ignored;
    socket.cancel(ignored);
  });

  std::vector<uint8_t> buffer(codec::MAX_PACKET_SIZE);
  boost::system::error_code ec;
  const size_t received = co_await socket.async_receive(
      boost::asio::buffer(buffer),
      boost::asio::redirect_error(boost::asio::use_awaitable, ec));

  if (ec == boost::asio::error::eof) {
    co_return std::nullopt;
  }
  if (ec) {
    throw boost::system::system_error(ec);
  }

  co_return codec_->decode(buffer.data(), received);
}

Task<size_t> Reactor::send(tcp::socket &socket, const codec::Message &message) {
  throw_if_stopping();
  auto scope = track([&socket]() {
    boost::system::error_code ignored;
    socket.cancel(ignored);
  });

  const std::vector<uint8_t> packet = codec_->encode(message);
  co_return co_await boost::asio::async_write(
      socket, boost::asio::buffer(packet), boost::asio::use_awaitable);
}

Task<void> Reactor::sleep(Clock::duration duration) {
  throw_if_stopping();

  boost::asio::steady_timer timer(*io_context_, duration);
  auto scope = track([&timer]() { timer.cancel(); });

  co_await timer.async_wait(boost::asio::use_awaitable);
}

void Reactor::spawn(Task<void> task, std::string name) {
  if (stopping_) {
    LOG_NET_DEBUG("reactor is shutting down, not scheduling task '{}'", name);
    return;
  }

  ++active_tasks_;
  LOG_NET_TRACE("spawning task '{}' ({} active)", name, active_tasks_.load());
  boost::asio::co_spawn(
      *io_context_, std::move(task),
      [this, name = std::move(name)](std::exception_ptr error) {
        on_task_exit(name, error);
      });
}

void Reactor::on_task_exit(const std::string &name, std::exception_ptr error) {
  const size_t remaining = --active_tasks_;
  log_task_exit(name, error);

  if (remaining == 0 && !stopping_ && idle_handler_) {
    LOG_NET_DEBUG("last task '{}' exited, reactor is idle", name);
    idle_handler_();
  }
}

void Reactor::log_task_exit(const std::string &name, std::exception_ptr error) {
  if (!error) {
    LOG_NET_TRACE("task '{}' finished", name);
    return;
  }

  try {
    std::rethrow_exception(error);
  } catch (const boost::system::system_error &e) {
    if (e.code() == boost::asio::error::operation_aborted && stopping_) {
      LOG_NET_DEBUG("task '{}' cancelled", name);
    } else {
      LOG_NET_ERROR("task '{}' failed: {}", name, e.what());
    }
  } catch (const std::exception &e) {
    LOG_NET_ERROR("task '{}' failed: {}", name, e.what());
  } catch (...) {
    LOG_NET_ERROR("task '{}' failed with a non-standard exception", name);
  }
}

void Reactor::fire(const WatchKey &key, uint64_t generation,
                   const boost::system::error_code &ec) {
  auto it = watchers_.find(key);
  if (it == watchers_.end() || it->second.generation != generation) {
    return; // superseded by a newer watch
  }

  ReadyCallback callback = std::move(it->second.callback);
  watchers_.erase(it);
  callback(ec);
}

void Reactor::cancel_all() {
  // Cancellation never runs handlers inline, so iterating is safe
  for (auto &[key, watcher] : watchers_) {
    if (watcher.cancel) {
      watcher.cancel();
    }
  }
  for (auto &[id, cancel] : pending_) {
    cancel();
  }
}

void Reactor::run() {
  if (shut_down_) {
    LOG_NET_WARN("reactor run() called after shutdown");
    return;
  }

  io_context_->restart();
  if (stop_requested_) {
    return;
  }

  auto work = boost::asio::make_work_guard(*io_context_);
  io_context_->run();
}

void Reactor::stop() {
  stop_requested_ = true;
  io_context_->stop();
}

void Reactor::force_stop() {
  force_stop_ = true;
  io_context_->stop();
}

void Reactor::shutdown() {
  if (shut_down_) {
    return;
  }

  stopping_ = true;
  LOG_NET_DEBUG("reactor shutdown: cancelling {} task(s)", active_tasks_.load());

  cancel_all();

  size_t passes = 0;
  while (active_tasks_ > 0 && passes < MAX_DRAIN_PASSES && !force_stop_) {
    ++passes;
    io_context_->restart();
    io_context_->poll();
    if (active_tasks_ > 0) {
      // Waits registered during this pass by tasks still unwinding
      cancel_all();
    }
  }
  drain_passes_ = passes;

  if (active_tasks_ > 0) {
    LOG_NET_WARN("{} task(s) did not unwind after {} drain pass(es), abandoning them",
                 active_tasks_.load(), passes);
  } else {
    LOG_NET_DEBUG("reactor shutdown complete after {} drain pass(es)", passes);
  }

  shut_down_ = true;
}

} // namespace reactor
} // namespace beacon
