// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "app/role_runner.hpp"
#include "discovery/config.hpp"
#include "util/logging.hpp"

namespace beacon {
namespace app {

RoleRunner::RoleRunner(Factory factory, std::chrono::milliseconds stop_timeout)
    : factory_(std::move(factory)), stop_timeout_(stop_timeout) {}

RoleRunner::~RoleRunner() { stop(); }

bool RoleRunner::start() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  if (running_) {
    if (!role_exited_) {
      return true;
    }
    stop_locked();
  }

  std::unique_ptr<discovery::Role> role;
  try {
    role = factory_();
  } catch (const ConfigError &e) {
    LOG_APP_ERROR("invalid configuration: {}", e.what());
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    last_error_ = e.what();
    return false;
  }

  auto reactor = std::make_unique<reactor::Reactor>();
  reactor->set_idle_handler([this, raw = reactor.get(), name = role->name()]() {
    LOG_APP_ERROR("{} has no running tasks left", name);
    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      last_error_ = name + ": all tasks exited";
    }
    role_exited_ = true;
    raw->stop();
  });
  try {
    role->start(*reactor);
  } catch (const std::exception &e) {
    LOG_APP_ERROR("failed to start {}: {}", role->name(), e.what());
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    last_error_ = e.what();
    return false;
  }

  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    finished_ = false;
    last_error_.clear();
    role_name_ = role->name();
  }

  role_ = std::move(role);
  reactor_ = std::move(reactor);
  role_exited_ = false;
  running_ = true;
  loop_thread_ = std::thread(&RoleRunner::run_loop, this);

  LOG_APP_INFO("{} started", role_name());
  return true;
}

void RoleRunner::run_loop() {
  try {
    reactor_->run();
  } catch (const std::exception &e) {
    LOG_APP_ERROR("{} event loop failed: {}", role_->name(), e.what());
  }
  reactor_->shutdown();

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    finished_ = true;
  }
  finished_cv_.notify_all();
}

void RoleRunner::stop() {
  std::lock_guard<std::mutex> lock(start_stop_mutex_);
  stop_locked();
}

void RoleRunner::stop_locked() {
  if (!running_) {
    return;
  }

  const std::string name = role_name();
  LOG_APP_INFO("stopping {}...", name);

  reactor_->stop();

  {
    std::unique_lock<std::mutex> state_lock(state_mutex_);
    if (!finished_cv_.wait_for(state_lock, stop_timeout_, [this]() { return finished_; })) {
      LOG_APP_WARN("{} did not stop within {} ms, forcing", name, stop_timeout_.count());
      reactor_->force_stop();
    }
  }

  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }

  // Reactor first: abandoned task frames may still reference the role
  reactor_.reset();
  role_.reset();
  running_ = false;

  {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    role_name_.clear();
  }
  LOG_APP_INFO("{} stopped", name);
}

std::string RoleRunner::last_error() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_error_;
}

std::string RoleRunner::role_name() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return role_name_;
}

} // namespace app
} // namespace beacon
