// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <utility>
#include <variant>

namespace beacon {
namespace reactor {

// Outcome of one non-blocking I/O attempt.
//
//   Ready(value)  - the attempt completed
//   WouldBlock    - the socket is not ready; wait for readiness and retry
//   Fatal(error)  - unrecoverable; the pending operation fails with `error`
template <typename T>
class IoResult {
public:
  static IoResult Ready(T value) { return IoResult(std::move(value)); }
  static IoResult WouldBlock() { return IoResult(WouldBlockTag{}); }
  static IoResult Fatal(boost::system::error_code error) {
    return IoResult(std::move(error));
  }

  // Classify the (value, error_code) pair returned by a non-blocking
  // socket call. would_block, try_again and interrupted are retryable.
  static IoResult FromOutcome(T value, const boost::system::error_code &ec) {
    if (!ec) {
      return Ready(std::move(value));
    }
    if (IsRetryable(ec)) {
      return WouldBlock();
    }
    return Fatal(ec);
  }

  bool is_ready() const { return state_.index() == 0; }
  bool would_block() const { return state_.index() == 1; }
  bool is_fatal() const { return state_.index() == 2; }

  T &value() { return std::get<0>(state_); }
  const T &value() const { return std::get<0>(state_); }
  const boost::system::error_code &error() const { return std::get<2>(state_); }

  static bool IsRetryable(const boost::system::error_code &ec) {
    return ec == boost::asio::error::would_block ||
           ec == boost::asio::error::try_again ||
           ec == boost::asio::error::interrupted;
  }

private:
  struct WouldBlockTag {};

  explicit IoResult(T value) : state_(std::in_place_index<0>, std::move(value)) {}
  explicit IoResult(WouldBlockTag tag) : state_(std::in_place_index<1>, tag) {}
  explicit IoResult(boost::system::error_code error)
      : state_(std::in_place_index<2>, std::move(error)) {}

  std::variant<T, WouldBlockTag, boost::system::error_code> state_;
};

} // namespace reactor
} // namespace beacon
