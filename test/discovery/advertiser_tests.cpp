// Advertiser: destination resolution and presence announcements end to end
#include <catch2/catch_test_macros.hpp>
#include "discovery/advertiser.hpp"
#include "discovery/presence.hpp"
#include "discovery/registry.hpp"
#include "test_helpers.hpp"
#include "util/time.hpp"
#include <optional>
#include <vector>

using namespace beacon;
using namespace beacon::discovery;
using namespace beacon::test;

TEST_CASE("Advertiser - destination is the subnet broadcast address", "[discovery][advertiser]") {
    DiscoveryConfig config;
    config.subnet = "10.0.0.0/24";
    config.port = 9999;

    Advertiser advertiser(config);
    REQUIRE(advertiser.name() == "advertiser");
    REQUIRE(advertiser.destination().address().to_string() == "10.0.0.255");
    REQUIRE(advertiser.destination().port() == 9999);
    REQUIRE(advertiser.interval() == DEFAULT_ANNOUNCE_INTERVAL);
    REQUIRE(advertiser.announcements_sent() == 0);
}

TEST_CASE("Advertiser - invalid configuration is rejected up front", "[discovery][advertiser]") {
    DiscoveryConfig config;
    config.subnet = "10.0.0.0/24";
    config.port = 9999;

    SECTION("Malformed subnet") {
        config.subnet = "10.0.0/24";
        REQUIRE_THROWS_AS(Advertiser(config), ConfigError);
    }

    SECTION("Host bits set") {
        config.subnet = "10.0.0.1/24";
        REQUIRE_THROWS_AS(Advertiser(config), ConfigError);
    }

    SECTION("Port zero") {
        config.port = 0;
        REQUIRE_THROWS_AS(Advertiser(config), ConfigError);
    }

    SECTION("Non-positive interval") {
        config.interval = std::chrono::milliseconds(0);
        REQUIRE_THROWS_AS(Advertiser(config), ConfigError);
    }
}

TEST_CASE("Advertiser - announces {time} on every interval", "[discovery][advertiser]") {
    util::MockTimeScope mock_time(1700000000);

    std::vector<Observation> seen;
    DiscoveryConfig registry_config;
    registry_config.subnet = LOOPBACK_SUBNET;
    Registry registry(registry_config, [&seen](const Observation& o) { seen.push_back(o); });
    std::optional<Advertiser> advertiser;

    // Declared after the roles: it shuts down (and stops using them) first
    reactor::Reactor reactor;
    registry.start(reactor);
    REQUIRE(RunUntil(reactor, [&] { return registry.broadcast_port() != 0; }));

    DiscoveryConfig config;
    config.subnet = LOOPBACK_SUBNET;
    config.port = registry.broadcast_port();
    config.interval = std::chrono::milliseconds(20);
    advertiser.emplace(config);
    advertiser->start(reactor);

    REQUIRE(RunUntil(reactor, [&] { return seen.size() >= 3; }));

    REQUIRE(advertiser->announcements_sent() >= 3);
    for (const auto& observation : seen) {
        REQUIRE(observation.source == Observation::Source::Broadcast);
        REQUIRE(observation.address == "127.0.0.1");
        REQUIRE(observation.message.size() == 1);
        REQUIRE(PresenceTime(observation.message) == 1700000000.0);
    }

    reactor.shutdown();
    REQUIRE(reactor.active_tasks() == 0);
}

TEST_CASE("Advertiser - cadence follows the interval", "[discovery][advertiser]") {
    DiscoveryConfig registry_config;
    registry_config.subnet = LOOPBACK_SUBNET;
    Registry registry(registry_config);
    std::optional<Advertiser> advertiser;

    reactor::Reactor reactor;
    registry.start(reactor);
    REQUIRE(RunUntil(reactor, [&] { return registry.broadcast_port() != 0; }));

    DiscoveryConfig config;
    config.subnet = LOOPBACK_SUBNET;
    config.port = registry.broadcast_port();
    config.interval = std::chrono::milliseconds(200);
    advertiser.emplace(config);
    advertiser->start(reactor);

    // The first announcement goes out immediately, the next one only after the interval
    REQUIRE(RunUntil(reactor, [&] { return advertiser->announcements_sent() == 1; }));
    RunUntil(reactor, [] { return false; }, std::chrono::milliseconds(50));
    REQUIRE(advertiser->announcements_sent() == 1);

    REQUIRE(RunUntil(reactor, [&] { return advertiser->announcements_sent() >= 2; }));
}
