// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "reactor/io_result.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace beacon {
namespace reactor {

enum class Direction { Read, Write };

// Invoked once when the socket becomes ready in the armed direction, or with
// an error (operation_aborted on cancellation).
using ReadyCallback = std::function<void(const boost::system::error_code &)>;

enum class OpState { Pending, Attempting, WouldBlock, Complete, Error };

/**
 * ReadinessOperation - one pending readiness-driven I/O operation
 *
 * PENDING -> ATTEMPTING -> {WOULD_BLOCK -> (arm) -> ATTEMPTING} | COMPLETE | ERROR
 *
 * `attempt` performs the non-blocking call and classifies it as an IoResult.
 * `arm` registers a ReadyCallback for the socket's readiness; the operation
 * re-attempts from that callback. The completion handler runs exactly once,
 * on entry to COMPLETE or ERROR, and always through the handler's executor
 * (never inline from the initiating call).
 */
template <typename T, typename Attempt, typename Arm, typename Handler>
class ReadinessOperation
    : public std::enable_shared_from_this<ReadinessOperation<T, Attempt, Arm, Handler>> {
public:
  ReadinessOperation(boost::asio::any_io_executor executor, Attempt attempt,
                     Arm arm, Handler handler)
      : executor_(std::move(executor)), attempt_(std::move(attempt)),
        arm_(std::move(arm)), handler_(std::move(handler)) {}

  void start() { step(); }

  OpState state() const { return state_; }

private:
  void step() {
    if (resolved_) {
      return;
    }
    state_ = OpState::Attempting;
    IoResult<T> result = attempt_();

    if (result.would_block()) {
      state_ = OpState::WouldBlock;
      auto self = this->shared_from_this();
      arm_(ReadyCallback([self](const boost::system::error_code &ec) {
        if (ec) {
          self->finish(OpState::Error, ec, T{});
          return;
        }
        self->step();
      }));
      return;
    }

    if (result.is_fatal()) {
      finish(OpState::Error, result.error(), T{});
      return;
    }

    finish(OpState::Complete, boost::system::error_code{}, std::move(result.value()));
  }

  void finish(OpState terminal, boost::system::error_code ec, T value) {
    if (resolved_) {
      return;
    }
    resolved_ = true;
    state_ = terminal;

    auto ex = boost::asio::get_associated_executor(handler_, executor_);
    boost::asio::post(ex, [handler = std::move(handler_), ec,
                           value = std::move(value)]() mutable {
      handler(ec, std::move(value));
    });
  }

  boost::asio::any_io_executor executor_;
  Attempt attempt_;
  Arm arm_;
  Handler handler_;
  OpState state_ = OpState::Pending;
  bool resolved_ = false;
};

/**
 * Readiness-driven retry combinator
 *
 * Completion signature: void(boost::system::error_code, T).
 *
 * @param executor  Executor used to deliver the completion
 * @param attempt   Callable `IoResult<T>()` performing one non-blocking try
 * @param arm       Callable `void(ReadyCallback)` registering readiness interest
 * @param token     Completion token (use_awaitable, a callback, ...)
 */
template <typename T, typename Attempt, typename Arm, typename CompletionToken>
auto AsyncRetryUntilReady(boost::asio::any_io_executor executor, Attempt attempt,
                          Arm arm, CompletionToken &&token) {
  return boost::asio::async_initiate<CompletionToken,
                                     void(boost::system::error_code, T)>(
      [executor](auto handler, Attempt attempt_fn, Arm arm_fn) {
        using Handler = std::decay_t<decltype(handler)>;
        auto op = std::make_shared<ReadinessOperation<T, Attempt, Arm, Handler>>(
            executor, std::move(attempt_fn), std::move(arm_fn), std::move(handler));
        op->start();
      },
      token, std::move(attempt), std::move(arm));
}

} // namespace reactor
} // namespace beacon
