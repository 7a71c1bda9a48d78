#include "util/netaddress.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>

namespace beacon {
namespace util {

namespace {

uint32_t PrefixMask(unsigned prefix_length) {
  if (prefix_length == 0) {
    return 0;
  }
  return ~uint32_t{0} << (32 - prefix_length);
}

} // namespace

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(address, ec);
  if (ec) {
    LOG_TRACE("ValidateAndNormalizeIP: rejecting '{}': {}", address, ec.message());
    return std::nullopt;
  }

  // Example: ::ffff:192.168.1.1 -> 192.168.1.1
  if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
    auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, ip.to_v6());
    return v4.to_string();
  }

  return ip.to_string();
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

boost::asio::ip::address_v4 Subnet::broadcast() const {
  return boost::asio::ip::address_v4(network.to_uint() | ~PrefixMask(prefix_length));
}

std::optional<Subnet> ParseSubnet(const std::string& cidr) {
  const size_t slash = cidr.find('/');
  const std::string address_part = cidr.substr(0, slash);

  unsigned prefix_length = 32;
  if (slash != std::string::npos) {
    auto prefix = SafeParseInt(cidr.substr(slash + 1), 0, 32);
    if (!prefix) {
      return std::nullopt;
    }
    prefix_length = static_cast<unsigned>(*prefix);
  }

  boost::system::error_code ec;
  auto address = boost::asio::ip::make_address_v4(address_part, ec);
  if (ec) {
    LOG_TRACE("ParseSubnet: '{}' is not an IPv4 network: {}", cidr, ec.message());
    return std::nullopt;
  }

  if ((address.to_uint() & ~PrefixMask(prefix_length)) != 0) {
    LOG_TRACE("ParseSubnet: '{}' has host bits set", cidr);
    return std::nullopt;
  }

  return Subnet{address, prefix_length};
}

} // namespace util
} // namespace beacon
