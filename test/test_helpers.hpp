#ifndef BEACON_TEST_HELPERS_HPP
#define BEACON_TEST_HELPERS_HPP

#include "reactor/reactor.hpp"
#include <chrono>
#include <thread>

namespace beacon {
namespace test {

using namespace std::chrono_literals;

// Drive the reactor's io_context on the calling thread until `done()` holds or
// `timeout` elapses. Returns the final value of `done()`.
template <typename Predicate>
bool RunUntil(reactor::Reactor& reactor, Predicate done,
              std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        reactor.io_context().restart();
        if (reactor.io_context().run_for(10ms) == 0) {
            // Nothing was runnable: the context may have no work at all
            std::this_thread::sleep_for(1ms);
        }
    }
    return true;
}

// Poll-wait from a thread that does not own the reactor
template <typename Predicate>
bool WaitFor(Predicate done, std::chrono::milliseconds timeout = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

// Subnet whose broadcast address is the loopback host, so discovery traffic
// stays on this machine
constexpr const char* LOOPBACK_SUBNET = "127.0.0.1/32";

} // namespace test
} // namespace beacon

#endif
