#pragma once

#include "codec/message_codec.hpp"
#include <optional>

namespace beacon {
namespace discovery {

// Presence announcement: {"time": <unix seconds>}
codec::Message MakePresence(double unix_time);

// The announced time, or std::nullopt if `message` is not a presence message
std::optional<double> PresenceTime(const codec::Message &message);

} // namespace discovery
} // namespace beacon
