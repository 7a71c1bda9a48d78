// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace beacon {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 1;
constexpr int CLIENT_VERSION_MINOR = 0;
constexpr int CLIENT_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Full version info for display
inline std::string GetFullVersionString() {
  return "Beacon version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

// ANSI color codes
namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";  // server
constexpr const char *GREEN = "\033[1;32m"; // service
} // namespace colors

// Startup banner naming the role being run ("server" or "service")
inline std::string GetStartupBanner(const std::string &role) {
  const char *color = colors::RESET;
  if (role == "server") {
    color = colors::BLUE;
  } else if (role == "service") {
    color = colors::GREEN;
  }

  const std::string rule(48, '=');
  std::string banner;
  banner += "\n";
  banner += color;
  banner += rule + "\n";
  banner += "  Beacon - LAN presence discovery\n";
  banner += "  Version: " + GetVersionString() + "\n";
  banner += "  Role:    " + role + "\n";
  banner += "  " + GetCopyrightString() + "\n";
  banner += rule;
  banner += colors::RESET;
  banner += "\n\n";

  return banner;
}

} // namespace beacon
