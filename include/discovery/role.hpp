#pragma once

#include <string>

namespace beacon {
namespace reactor {
class Reactor;
}

namespace discovery {

// Role - a long-running discovery role scheduled on a Reactor
//
// Implementations validate their configuration in the constructor (throwing
// ConfigError) and create sockets lazily inside the tasks start() spawns.
// The role must outlive the Reactor's shutdown.
class Role {
public:
  virtual ~Role() = default;

  virtual std::string name() const = 0;

  // Spawn the role's tasks; they run when the reactor runs
  virtual void start(reactor::Reactor &reactor) = 0;
};

} // namespace discovery
} // namespace beacon
