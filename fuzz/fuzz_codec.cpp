// Fuzz target for message decoding
// Discovery listeners decode whatever arrives on the broadcast address, so
// decode() must never throw or crash, and anything it accepts must re-encode
// to a stable byte form.

#include "codec/message_codec.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace beacon::codec;

    static const JsonCodec codec;

    // Listeners never read more than one packet's worth
    if (size > MAX_PACKET_SIZE) return 0;

    auto message = codec.decode(data, size);
    if (!message) return 0;

    // Decoded messages must survive a round trip
    std::vector<uint8_t> encoded = codec.encode(*message);
    auto reparsed = codec.decode(encoded);
    if (!reparsed) {
        __builtin_trap();
    }

    // Out-of-range floats encode as null, so compare encodings, not values
    if (codec.encode(*reparsed) != encoded) {
        __builtin_trap();
    }

    // Empty-message detection must be total
    (void)IsEmptyMessage(*message);

    return 0;
}
