#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "call/call_metadata.hpp"
#include "media/media_metadata.hpp"

// Byte layouts of the MCS/TBS characteristics. All multi-byte integers are little-endian.
namespace codec
{

using Bytes = std::vector<std::uint8_t>;

// single-call model: every TBS record carries call index 1
inline constexpr std::uint8_t CALL_INDEX = 0x01;
inline constexpr std::uint8_t CALL_FLAGS = 0x00;

Bytes encode_string(std::string_view s);
Bytes encode_u8(std::uint8_t v);
Bytes encode_u32_le(std::uint32_t v);
bool  decode_u32_le(const Bytes &in, std::uint32_t &out);

// ms -> 4-byte centiseconds, saturating
Bytes                        encode_centiseconds(std::uint64_t ms);
std::optional<std::uint64_t> decode_centiseconds(const Bytes &in);

Bytes encode_media_state(media::MediaState s);
Bytes encode_call_state(call::CallState s);             // [index, state, flags]
Bytes encode_termination(call::TerminationReason r);    // [index, reason]

// control point: first byte only, remaining bytes are parameters this layer ignores
std::optional<std::uint8_t> decode_opcode(const Bytes &in);

std::string decode_string(const Bytes &in);
std::string to_hex(const Bytes &in);  // "01 04 00", for logs

}  // namespace codec
