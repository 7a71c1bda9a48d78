#include "application.hpp"
#include "discovery/advertiser.hpp"
#include "discovery/registry.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace beacon {
namespace app {

std::string RoleCommand(RoleKind kind) {
  switch (kind) {
  case RoleKind::Registry:
    return "server";
  case RoleKind::Advertiser:
    return "service";
  }
  return "unknown";
}

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;

  const discovery::DiscoveryConfig discovery_config = config_.discovery;
  RoleRunner::Factory factory;
  if (config_.role == RoleKind::Registry) {
    factory = [discovery_config]() -> std::unique_ptr<discovery::Role> {
      return std::make_unique<discovery::Registry>(discovery_config);
    };
  } else {
    factory = [discovery_config]() -> std::unique_ptr<discovery::Role> {
      return std::make_unique<discovery::Advertiser>(discovery_config);
    };
  }
  runner_ = std::make_unique<RoleRunner>(std::move(factory));
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  std::cout << GetStartupBanner(RoleCommand(config_.role)) << std::flush;

  LOG_APP_INFO("Starting {} on subnet {} port {}", RoleCommand(config_.role),
               config_.discovery.subnet, config_.discovery.port);

  setup_signal_handlers();

  if (!runner_->start()) {
    last_error_ = runner_->last_error();
    LOG_APP_ERROR("Failed to start {}: {}", RoleCommand(config_.role), last_error_);
    return false;
  }

  running_ = true;
  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }

  shutdown();
}

bool Application::wait_for_shutdown() {
  // Wait for shutdown signal
  while (running_ && !shutdown_requested_ && runner_->is_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_ || !running_) {
    shutdown();
    return true;
  }

  last_error_ = runner_->last_error();
  LOG_APP_ERROR("{} stopped unexpectedly: {}", RoleCommand(config_.role), last_error_);
  shutdown();
  return false;
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_APP_INFO("Shutting down...");
  running_ = false;
  runner_->stop();
  LOG_APP_INFO("Shutdown complete");
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17); // Literal length avoids strlen()
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace beacon
