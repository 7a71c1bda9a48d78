// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace beacon {
namespace codec {

// Structured message carried by every datagram and stream payload
using Message = nlohmann::json;

// Largest payload read by a single receive
constexpr size_t MAX_PACKET_SIZE = 4096;

// MessageCodec - wire-format boundary between messages and raw bytes
//
// decode() never throws: bytes that do not form a valid message yield
// std::nullopt ("no message"). Discovery shares a broadcast address with
// unrelated senders, so undecodable input is ignored by callers.
class MessageCodec {
public:
  virtual ~MessageCodec() = default;

  virtual std::vector<uint8_t> encode(const Message &message) const = 0;

  virtual std::optional<Message> decode(const uint8_t *data,
                                        size_t size) const = 0;

  std::optional<Message> decode(const std::vector<uint8_t> &packet) const {
    return decode(packet.data(), packet.size());
  }
};

// JsonCodec - compact UTF-8 JSON text
class JsonCodec : public MessageCodec {
public:
  std::vector<uint8_t> encode(const Message &message) const override;
  std::optional<Message> decode(const uint8_t *data,
                                size_t size) const override;
  using MessageCodec::decode;
};

std::shared_ptr<const MessageCodec> DefaultCodec();

/**
 * True for messages that carry nothing: null, false, 0, "", {} and [].
 * Sending such a message is a no-op.
 */
bool IsEmptyMessage(const Message &message);

} // namespace codec
} // namespace beacon
