// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "codec/message_codec.hpp"
#include "util/logging.hpp"

namespace beacon {
namespace codec {

std::vector<uint8_t> JsonCodec::encode(const Message &message) const {
  // Replace invalid UTF-8 in strings instead of throwing type_error 316
  const std::string text =
      message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  return std::vector<uint8_t>(text.begin(), text.end());
}

std::optional<Message> JsonCodec::decode(const uint8_t *data,
                                         size_t size) const {
  if (data == nullptr || size == 0) {
    return std::nullopt;
  }

  // allow_exceptions=false: parse errors produce a discarded value
  Message message = Message::parse(data, data + size, nullptr, false);
  if (message.is_discarded()) {
    LOG_NET_TRACE("dropping undecodable packet ({} bytes)", size);
    return std::nullopt;
  }
  return message;
}

std::shared_ptr<const MessageCodec> DefaultCodec() {
  static const auto codec = std::make_shared<const JsonCodec>();
  return codec;
}

bool IsEmptyMessage(const Message &message) {
  switch (message.type()) {
  case Message::value_t::null:
  case Message::value_t::discarded:
    return true;
  case Message::value_t::boolean:
    return !message.get<bool>();
  case Message::value_t::number_integer:
    return message.get<int64_t>() == 0;
  case Message::value_t::number_unsigned:
    return message.get<uint64_t>() == 0;
  case Message::value_t::number_float:
    return message.get<double>() == 0.0;
  case Message::value_t::string:
    return message.get_ref<const std::string &>().empty();
  case Message::value_t::object:
  case Message::value_t::array:
    return message.empty();
  default:
    return false;
  }
}

} // namespace codec
} // namespace beacon
