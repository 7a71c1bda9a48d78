// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/role.hpp"
#include "reactor/reactor.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace beacon {
namespace app {

/**
 * RoleRunner - owns one role and the Reactor it runs on
 *
 * start() builds the role (validating its configuration on the caller's
 * thread), creates a fresh Reactor, spawns the role's tasks and runs the loop
 * on a dedicated thread. stop() asks the loop to return, waits for the
 * reactor's shutdown drain, and falls back to force_stop() once stop_timeout
 * expires. Both are idempotent and may be called from any thread except the
 * reactor thread. If the role's last task exits without a stop(), the loop
 * returns, is_running() turns false and last_error() says why; stop() or a new
 * start() then releases the dead reactor.
 *
 * The Reactor is created per start() and destroyed by stop(), so each
 * RoleRunner is independent of every other one in the process.
 */
class RoleRunner {
public:
  using Factory = std::function<std::unique_ptr<discovery::Role>()>;

  static constexpr std::chrono::milliseconds DEFAULT_STOP_TIMEOUT{1000};

  explicit RoleRunner(Factory factory,
                      std::chrono::milliseconds stop_timeout = DEFAULT_STOP_TIMEOUT);
  ~RoleRunner();

  RoleRunner(const RoleRunner &) = delete;
  RoleRunner &operator=(const RoleRunner &) = delete;

  // Returns false if the role's configuration is invalid (see last_error())
  // or if the role could not be scheduled. A second start() while running is
  // a no-op that returns true.
  bool start();

  void stop();

  // True while the role still has work on its reactor. Becomes false on its
  // own when every task of the role has exited (e.g. all binds failed).
  bool is_running() const { return running_.load() && !role_exited_.load(); }

  // Message of the failure that made the last start() return false, or of
  // the role exiting by itself
  std::string last_error() const;

  // Name of the running role; empty when stopped
  std::string role_name() const;

  // Null once stopped; for tests that inspect the loop
  discovery::Role *role() { return role_.get(); }
  reactor::Reactor *reactor() { return reactor_.get(); }

private:
  void run_loop();
  void stop_locked();

  Factory factory_;
  std::chrono::milliseconds stop_timeout_;

  // Serializes start()/stop()
  std::mutex start_stop_mutex_;
  std::atomic<bool> running_{false};
  std::atomic<bool> role_exited_{false};

  std::unique_ptr<discovery::Role> role_;
  std::unique_ptr<reactor::Reactor> reactor_;
  std::thread loop_thread_;

  // Set by the loop thread once the reactor has shut down
  mutable std::mutex state_mutex_;
  std::condition_variable finished_cv_;
  bool finished_ = true;
  std::string last_error_;
  std::string role_name_;
};

} // namespace app
} // namespace beacon
