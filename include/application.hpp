#pragma once

#include "app/role_runner.hpp"
#include "discovery/config.hpp"
#include <atomic>
#include <csignal>
#include <memory>
#include <string>

namespace beacon {
namespace app {

enum class RoleKind {
  Registry,   // "server"
  Advertiser, // "service"
};

// Command-line word for a role ("server" / "service")
std::string RoleCommand(RoleKind kind);

// Application configuration
struct AppConfig {
  RoleKind role = RoleKind::Registry;

  discovery::DiscoveryConfig discovery;

  // Logging
  std::string log_level = "info";
  std::string log_file; // empty = console
  bool verbose = false;
};

// Application - runs one discovery role until a signal or request_shutdown()
// Owns the RoleRunner; installs SIGINT/SIGTERM handlers in start().
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool start();
  void stop();
  // Blocks until a signal or request_shutdown(). Returns false if the role
  // stopped by itself first (see last_error()).
  bool wait_for_shutdown();

  // Status
  bool is_running() const { return running_; }
  const std::string &last_error() const { return last_error_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::string last_error_;

  std::unique_ptr<RoleRunner> runner_;

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace beacon
