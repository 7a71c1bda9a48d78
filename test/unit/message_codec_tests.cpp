// Unit tests for the JSON message codec and presence messages
#include <catch2/catch_test_macros.hpp>
#include "codec/message_codec.hpp"
#include "discovery/presence.hpp"
#include <string>

using namespace beacon;
using namespace beacon::codec;

namespace {

std::vector<uint8_t> Bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

std::string Text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST_CASE("JsonCodec - encode produces compact JSON", "[codec]") {
    JsonCodec codec;

    SECTION("Presence message") {
        REQUIRE(Text(codec.encode(Message{{"time", 1.5}})) == R"({"time":1.5})");
    }

    SECTION("Nested values") {
        Message message = {{"hello", "world"}, {"ports", {1, 2}}};
        REQUIRE(Text(codec.encode(message)) == R"({"hello":"world","ports":[1,2]})");
    }

    SECTION("Invalid UTF-8 in a string is replaced, not thrown") {
        Message message = {{"name", std::string("bad\xff")}};
        std::vector<uint8_t> encoded;
        REQUIRE_NOTHROW(encoded = codec.encode(message));
        REQUIRE(codec.decode(encoded).has_value());
    }
}

TEST_CASE("JsonCodec - decode", "[codec]") {
    JsonCodec codec;

    SECTION("Round trip") {
        Message message = {{"time", 1700000000.25}, {"node", "alpha"}, {"tags", {"a", "b"}}};
        auto decoded = codec.decode(codec.encode(message));
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == message);
    }

    SECTION("Whitespace is accepted") {
        auto decoded = codec.decode(Bytes("  { \"hello\" : \"world\" }\n"));
        REQUIRE(decoded.has_value());
        REQUIRE((*decoded)["hello"] == "world");
    }

    SECTION("Scalars are messages too") {
        auto decoded = codec.decode(Bytes("42"));
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == 42);
    }
}

TEST_CASE("JsonCodec - malformed input is no message", "[codec]") {
    JsonCodec codec;

    SECTION("Truncated object") {
        REQUIRE_FALSE(codec.decode(Bytes("{not json")).has_value());
    }

    SECTION("Zero bytes") {
        REQUIRE_FALSE(codec.decode(std::vector<uint8_t>{}).has_value());
        REQUIRE_FALSE(codec.decode(nullptr, 0).has_value());
    }

    SECTION("Trailing garbage") {
        REQUIRE_FALSE(codec.decode(Bytes(R"({"time":1} extra)")).has_value());
    }

    SECTION("Invalid UTF-8") {
        REQUIRE_FALSE(codec.decode(Bytes("\"\xff\xfe\"")).has_value());
    }

    SECTION("Binary noise") {
        const std::vector<uint8_t> noise = {0x00, 0x01, 0xfe, 0x7b, 0x22};
        REQUIRE_NOTHROW(codec.decode(noise));
        REQUIRE_FALSE(codec.decode(noise).has_value());
    }
}

TEST_CASE("IsEmptyMessage", "[codec]") {
    SECTION("Values that carry nothing") {
        REQUIRE(IsEmptyMessage(Message()));
        REQUIRE(IsEmptyMessage(Message::object()));
        REQUIRE(IsEmptyMessage(Message::array()));
        REQUIRE(IsEmptyMessage(Message("")));
        REQUIRE(IsEmptyMessage(Message(0)));
        REQUIRE(IsEmptyMessage(Message(0u)));
        REQUIRE(IsEmptyMessage(Message(0.0)));
        REQUIRE(IsEmptyMessage(Message(false)));
    }

    SECTION("Values with content") {
        REQUIRE_FALSE(IsEmptyMessage(Message{{"time", 0.0}}));
        REQUIRE_FALSE(IsEmptyMessage(Message::array({0})));
        REQUIRE_FALSE(IsEmptyMessage(Message("x")));
        REQUIRE_FALSE(IsEmptyMessage(Message(-1)));
        REQUIRE_FALSE(IsEmptyMessage(Message(true)));
    }
}

TEST_CASE("DefaultCodec is a shared JsonCodec", "[codec]") {
    auto first = DefaultCodec();
    auto second = DefaultCodec();
    REQUIRE(first != nullptr);
    REQUIRE(first == second);
    REQUIRE(Text(first->encode(Message{{"a", 1}})) == R"({"a":1})");
}

TEST_CASE("Presence messages", "[codec][discovery]") {
    SECTION("MakePresence carries the time") {
        auto message = discovery::MakePresence(1700000000.5);
        REQUIRE(message.is_object());
        REQUIRE(message.size() == 1);
        REQUIRE(discovery::PresenceTime(message) == 1700000000.5);
    }

    SECTION("Other messages have no presence time") {
        REQUIRE_FALSE(discovery::PresenceTime(Message{{"hello", "world"}}).has_value());
        REQUIRE_FALSE(discovery::PresenceTime(Message{{"time", "noon"}}).has_value());
        REQUIRE_FALSE(discovery::PresenceTime(Message::array({1, 2})).has_value());
    }

    SECTION("Integer time is accepted") {
        REQUIRE(discovery::PresenceTime(Message{{"time", 1700000000}}) == 1700000000.0);
    }
}
