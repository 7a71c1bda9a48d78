#include "application.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // Keep for CLI output and early errors before logger initialized
#include <vector>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options] <server|service> <subnet> <port>\n"
      << "\n"
      << "Commands:\n"
      << "  server               Listen for presence broadcasts and TCP registrations\n"
      << "  service              Broadcast presence on the subnet\n"
      << "\n"
      << "Arguments:\n"
      << "  <subnet>             IPv4 CIDR, e.g. 192.168.1.0/24 (host bits must be zero)\n"
      << "  <port>               Discovery port (1-65535), shared by UDP and TCP\n"
      << "\n"
      << "Options:\n"
      << "  --bind=<ip>          Registry TCP bind address (default: 127.0.0.1)\n"
      << "  --interval=<ms>      Announcement interval for service (default: 1000)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: network, discovery, app, all\n"
      << "                       Can be comma-separated: --debug=network,discovery\n"
      << "  --logfile=<path>     Log to a rotating file instead of the console\n"
      << "  --verbose            Equivalent to --loglevel=debug\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    // Parse command line arguments
    beacon::app::AppConfig config;
    std::vector<std::string> debug_components;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << beacon::GetFullVersionString() << std::endl;
        std::cout << beacon::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--bind=") == 0) {
        std::string address = arg.substr(7);
        if (!beacon::util::IsValidIPAddress(address)) {
          std::cerr << "Error: Invalid bind address: " << address << std::endl;
          return 1;
        }
        config.discovery.bind_address = address;
      } else if (arg.find("--interval=") == 0) {
        auto interval_opt = beacon::util::SafeParseInt(arg.substr(11), 1, 3600000);
        if (!interval_opt) {
          std::cerr << "Error: Invalid interval: " << arg.substr(11) << std::endl;
          std::cerr << "Interval must be a number of milliseconds between 1 and 3600000"
                    << std::endl;
          return 1;
        }
        config.discovery.interval = std::chrono::milliseconds(*interval_opt);
      } else if (arg == "--verbose") {
        config.verbose = true;
        config.log_level = "debug";
      } else if (arg.find("--loglevel=") == 0) {
        config.log_level = arg.substr(11);
      } else if (arg.find("--logfile=") == 0) {
        config.log_file = arg.substr(10);
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated components: --debug=network,discovery
        for (const auto &component : beacon::util::SplitList(arg.substr(8), ',')) {
          debug_components.push_back(component);
        }
      } else if (arg.find("--") == 0) {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      } else {
        positional.push_back(arg);
      }
    }

    if (positional.size() != 3) {
      std::cerr << "Error: expected <server|service> <subnet> <port>" << std::endl;
      print_usage(argv[0]);
      return 1;
    }

    if (positional[0] == "server") {
      config.role = beacon::app::RoleKind::Registry;
    } else if (positional[0] == "service") {
      config.role = beacon::app::RoleKind::Advertiser;
    } else {
      std::cerr << "Unknown command: " << positional[0] << std::endl;
      print_usage(argv[0]);
      return 1;
    }

    config.discovery.subnet = positional[1];

    auto port_opt = beacon::util::SafeParsePort(positional[2]);
    if (!port_opt) {
      std::cerr << "Error: Invalid port number: " << positional[2] << std::endl;
      std::cerr << "Port must be a number between 1 and 65535" << std::endl;
      return 1;
    }
    config.discovery.port = *port_opt;

    // Initialize logging system
    beacon::util::LogManager::Initialize(config.log_level, !config.log_file.empty(),
                                         config.log_file);

    // Apply component-specific debug levels
    for (const auto &component : debug_components) {
      if (component == "all") {
        beacon::util::LogManager::SetLogLevel("trace");
      } else if (component == "net") {
        beacon::util::LogManager::SetComponentLevel("network", "trace");
      } else if (!beacon::util::LogManager::SetComponentLevel(component, "trace")) {
        std::cerr << "WARNING: unknown debug component '" << component << "'" << std::endl;
      }
    }

    // IMPORTANT: Use nested scope to ensure app destructor runs before LogManager::Shutdown()
    // The reactor thread may still log while the role is being stopped
    int exit_code = 0;
    {
      beacon::app::Application app(config);

      if (!app.start()) {
        std::cerr << "Error: " << app.last_error() << std::endl;
        exit_code = 1;
      } else {
        // Run until shutdown requested or the role dies on its own
        if (!app.wait_for_shutdown()) {
          std::cerr << "Error: " << app.last_error() << std::endl;
          exit_code = 1;
        }
      }
    }

    // Shutdown logging AFTER app is fully destroyed
    beacon::util::LogManager::Shutdown();

    return exit_code;

  } catch (const std::exception &e) {
    // Use std::cerr here because logger may not be safe during exception
    // handling
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    beacon::util::LogManager::Shutdown();
    return 1;
  }
}
