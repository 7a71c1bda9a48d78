// RoleRunner and Application lifecycle: start/stop contract on a real thread
#include <catch2/catch_test_macros.hpp>
#include "app/role_runner.hpp"
#include "application.hpp"
#include "discovery/advertiser.hpp"
#include "discovery/registry.hpp"
#include "test_helpers.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <memory>
#include <thread>

using namespace beacon;
using namespace beacon::app;
using namespace beacon::test;

namespace {

discovery::DiscoveryConfig LoopbackConfig() {
    discovery::DiscoveryConfig config;
    config.subnet = LOOPBACK_SUBNET;
    return config;
}

RoleRunner::Factory RegistryFactory(discovery::DiscoveryConfig config) {
    return [config]() -> std::unique_ptr<discovery::Role> {
        return std::make_unique<discovery::Registry>(config);
    };
}

// Holds a TCP listener and a UDP socket on the same loopback port so a
// Registry configured for that port fails both binds
struct PortHolder {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor tcp{io, boost::asio::ip::tcp::endpoint(
                                               boost::asio::ip::make_address_v4("127.0.0.1"), 0)};
    boost::asio::ip::udp::socket udp{io, boost::asio::ip::udp::endpoint(
                                             boost::asio::ip::make_address_v4("127.0.0.1"),
                                             tcp.local_endpoint().port())};

    uint16_t port() const { return tcp.local_endpoint().port(); }
};

// Role whose only task blocks the reactor thread between sleeps
class BlockingRole : public discovery::Role {
public:
    std::string name() const override { return "blocking"; }

    void start(reactor::Reactor& reactor) override {
        reactor.spawn(block(reactor), "block");
    }

    std::atomic<int> iterations{0};

private:
    reactor::Task<void> block(reactor::Reactor& reactor) {
        while (true) {
            ++iterations;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            co_await reactor.sleep(std::chrono::milliseconds(1));
        }
    }
};

} // namespace

TEST_CASE("RoleRunner - start and stop are idempotent", "[app][runner]") {
    RoleRunner runner(RegistryFactory(LoopbackConfig()));
    REQUIRE_FALSE(runner.is_running());
    REQUIRE(runner.role_name().empty());

    REQUIRE(runner.start());
    REQUIRE(runner.is_running());
    REQUIRE(runner.role_name() == "registry");

    reactor::Reactor* first_reactor = runner.reactor();
    REQUIRE(runner.start());
    REQUIRE(runner.reactor() == first_reactor);

    runner.stop();
    REQUIRE_FALSE(runner.is_running());
    REQUIRE(runner.role_name().empty());
    REQUIRE(runner.reactor() == nullptr);

    runner.stop();
    REQUIRE_FALSE(runner.is_running());

    // A stopped runner can start again on a fresh reactor
    REQUIRE(runner.start());
    REQUIRE(runner.is_running());
    runner.stop();
}

TEST_CASE("RoleRunner - configuration errors are reported without starting", "[app][runner]") {
    discovery::DiscoveryConfig config = LoopbackConfig();
    config.subnet = "300.0.0.0/24";

    RoleRunner runner(RegistryFactory(config));
    REQUIRE_FALSE(runner.start());
    REQUIRE_FALSE(runner.is_running());
    REQUIRE(runner.last_error().find("invalid subnet") != std::string::npos);
    REQUIRE(runner.reactor() == nullptr);

    runner.stop();
    REQUIRE_FALSE(runner.is_running());
}

TEST_CASE("RoleRunner - serves registrations from its own thread", "[app][runner]") {
    RoleRunner runner(RegistryFactory(LoopbackConfig()));
    REQUIRE(runner.start());

    auto* registry = dynamic_cast<discovery::Registry*>(runner.role());
    REQUIRE(registry != nullptr);
    REQUIRE(WaitFor([&] { return registry->listen_port() != 0; }));

    // Plain blocking client on the test thread
    boost::asio::io_context client_io;
    boost::asio::ip::tcp::socket client(client_io);
    client.connect(boost::asio::ip::tcp::endpoint(
        boost::asio::ip::make_address_v4("127.0.0.1"), registry->listen_port()));
    const std::string request = R"({"hello":"world"})";
    boost::asio::write(client, boost::asio::buffer(request));

    // The registry closes the connection without replying
    char reply[64];
    boost::system::error_code ec;
    const size_t n = client.read_some(boost::asio::buffer(reply), ec);
    REQUIRE(n == 0);
    REQUIRE(ec == boost::asio::error::eof);

    REQUIRE(WaitFor([&] { return registry->observation_count() == 1; }));

    runner.stop();
    REQUIRE_FALSE(runner.is_running());
}

TEST_CASE("RoleRunner - stop falls back to force_stop after the timeout", "[app][runner]") {
    BlockingRole* role = nullptr;
    RoleRunner runner(
        [&role]() -> std::unique_ptr<discovery::Role> {
            auto blocking = std::make_unique<BlockingRole>();
            role = blocking.get();
            return blocking;
        },
        std::chrono::milliseconds(10));

    REQUIRE(runner.start());
    REQUIRE(WaitFor([&] { return role->iterations.load() > 0; }));

    const auto begin = std::chrono::steady_clock::now();
    runner.stop();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE_FALSE(runner.is_running());
    REQUIRE(elapsed < std::chrono::seconds(2));
}

TEST_CASE("RoleRunner - a role whose tasks all exit is no longer running", "[app][runner]") {
    auto holder = std::make_unique<PortHolder>();
    discovery::DiscoveryConfig config = LoopbackConfig();
    config.port = holder->port();

    RoleRunner runner(RegistryFactory(config));
    REQUIRE(runner.start());

    REQUIRE(WaitFor([&] { return !runner.is_running(); }));
    REQUIRE(runner.last_error().find("all tasks exited") != std::string::npos);
    REQUIRE(runner.reactor() != nullptr);
    REQUIRE(runner.reactor()->active_tasks() == 0);

    // Once the port is free, start() replaces the dead reactor
    holder.reset();
    REQUIRE(runner.start());
    REQUIRE(runner.is_running());
    REQUIRE(runner.last_error().empty());

    auto* registry = dynamic_cast<discovery::Registry*>(runner.role());
    REQUIRE(registry != nullptr);
    REQUIRE(WaitFor([&] { return registry->listen_port() == config.port; }));
    REQUIRE(runner.is_running());

    runner.stop();
    REQUIRE_FALSE(runner.is_running());
}

TEST_CASE("RoleRunner - independent runners coexist", "[app][runner]") {
    discovery::DiscoveryConfig advertiser_config = LoopbackConfig();
    advertiser_config.port = 9;
    advertiser_config.interval = std::chrono::milliseconds(10);

    RoleRunner registry_runner(RegistryFactory(LoopbackConfig()));
    RoleRunner advertiser_runner([advertiser_config]() -> std::unique_ptr<discovery::Role> {
        return std::make_unique<discovery::Advertiser>(advertiser_config);
    });

    REQUIRE(registry_runner.start());
    REQUIRE(advertiser_runner.start());
    REQUIRE(registry_runner.reactor() != advertiser_runner.reactor());
    REQUIRE(advertiser_runner.role_name() == "advertiser");

    advertiser_runner.stop();
    REQUIRE(registry_runner.is_running());
    registry_runner.stop();
}

TEST_CASE("Application - runs a role until shutdown is requested", "[app]") {
    AppConfig config;
    config.role = RoleKind::Registry;
    config.discovery = LoopbackConfig();

    Application app(config);
    REQUIRE(Application::instance() == &app);
    REQUIRE(app.start());
    REQUIRE(app.is_running());

    std::thread requester([&app]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        app.request_shutdown();
    });
    REQUIRE(app.wait_for_shutdown());
    requester.join();

    REQUIRE_FALSE(app.is_running());
}

TEST_CASE("Application - configuration errors fail start", "[app]") {
    AppConfig config;
    config.role = RoleKind::Advertiser;
    config.discovery = LoopbackConfig();
    config.discovery.subnet = "10.0.0.0/99";
    config.discovery.port = 9999;

    Application app(config);
    REQUIRE_FALSE(app.start());
    REQUIRE_FALSE(app.is_running());
    REQUIRE_FALSE(app.last_error().empty());
}

TEST_CASE("Application - reports a role that stops by itself", "[app]") {
    PortHolder holder;

    AppConfig config;
    config.role = RoleKind::Registry;
    config.discovery = LoopbackConfig();
    config.discovery.port = holder.port();

    Application app(config);
    REQUIRE(app.start());

    REQUIRE_FALSE(app.wait_for_shutdown());
    REQUIRE_FALSE(app.is_running());
    REQUIRE(app.last_error().find("all tasks exited") != std::string::npos);
}

TEST_CASE("RoleCommand names", "[app]") {
    REQUIRE(RoleCommand(RoleKind::Registry) == "server");
    REQUIRE(RoleCommand(RoleKind::Advertiser) == "service");
}
