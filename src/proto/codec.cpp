#include "proto/codec.hpp"

#include <cstdio>
#include <limits>

namespace codec
{

Bytes encode_string(std::string_view s)
{
    return Bytes(s.begin(), s.end());
}

Bytes encode_u8(std::uint8_t v)
{
    return Bytes{v};
}

Bytes encode_u32_le(std::uint32_t v)
{
    Bytes out;
    out.reserve(4);
    out.push_back(static_cast<std::uint8_t>((v)&0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
    return out;
}

bool decode_u32_le(const Bytes &in, std::uint32_t &out)
{
    if (in.size() < 4)
        return false;
    out = (std::uint32_t)in[0] | ((std::uint32_t)in[1] << 8) | ((std::uint32_t)in[2] << 16) |
          ((std::uint32_t)in[3] << 24);
    return true;
}

Bytes encode_centiseconds(std::uint64_t ms)
{
    std::uint64_t cs = ms / 10;
    if (cs > std::numeric_limits<std::uint32_t>::max())
        cs = std::numeric_limits<std::uint32_t>::max();
    return encode_u32_le(static_cast<std::uint32_t>(cs));
}

std::optional<std::uint64_t> decode_centiseconds(const Bytes &in)
{
    std::uint32_t cs = 0;
    if (!decode_u32_le(in, cs))
        return std::nullopt;
    return static_cast<std::uint64_t>(cs) * 10;
}

Bytes encode_media_state(media::MediaState s)
{
    return encode_u8(static_cast<std::uint8_t>(s));
}

Bytes encode_call_state(call::CallState s)
{
    return Bytes{CALL_INDEX, static_cast<std::uint8_t>(s), CALL_FLAGS};
}

Bytes encode_termination(call::TerminationReason r)
{
    return Bytes{CALL_INDEX, static_cast<std::uint8_t>(r)};
}

std::optional<std::uint8_t> decode_opcode(const Bytes &in)
{
    if (in.empty())
        return std::nullopt;
    return static_cast<std::uint8_t>(in[0] & 0xFF);
}

std::string decode_string(const Bytes &in)
{
    return std::string(in.begin(), in.end());
}

std::string to_hex(const Bytes &in)
{
    std::string out;
    out.reserve(in.size() * 3);
    char b[4];
    for (size_t i = 0; i < in.size(); ++i)
    {
        std::snprintf(b, sizeof(b), i ? " %02x" : "%02x", (unsigned)in[i]);
        out += b;
    }
    return out;
}

}  // namespace codec
