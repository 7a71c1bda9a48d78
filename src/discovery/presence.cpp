#include "discovery/presence.hpp"

namespace beacon {
namespace discovery {

codec::Message MakePresence(double unix_time) {
  return codec::Message{{"time", unix_time}};
}

std::optional<double> PresenceTime(const codec::Message &message) {
  if (!message.is_object()) {
    return std::nullopt;
  }
  auto it = message.find("time");
  if (it == message.end() || !it->is_number()) {
    return std::nullopt;
  }
  return it->get<double>();
}

} // namespace discovery
} // namespace beacon
