#include <cstdint>
#include <gtest/gtest.h>
#include <limits>

#include "proto/codec.hpp"

using namespace codec;

TEST(Codec, StringsAreRawUtf8)
{
    EXPECT_EQ(encode_string("Song A"), (Bytes{'S', 'o', 'n', 'g', ' ', 'A'}));
    EXPECT_TRUE(encode_string("").empty());
    // multi-byte UTF-8 passes through untouched
    const std::string cafe = "Caf\xC3\xA9";
    EXPECT_EQ(encode_string(cafe).size(), 5u);
    EXPECT_EQ(decode_string(encode_string(cafe)), cafe);
}

TEST(Codec, U32IsLittleEndian)
{
    EXPECT_EQ(encode_u32_le(0x0000981F), (Bytes{0x1F, 0x98, 0x00, 0x00}));
    EXPECT_EQ(encode_u32_le(0x12345678), (Bytes{0x78, 0x56, 0x34, 0x12}));

    std::uint32_t v = 0;
    EXPECT_FALSE(decode_u32_le(Bytes{1, 2, 3}, v));
    ASSERT_TRUE(decode_u32_le(Bytes{0x78, 0x56, 0x34, 0x12}, v));
    EXPECT_EQ(v, 0x12345678u);
}

TEST(Codec, DurationInCentiseconds)
{
    // 180000 ms -> 18000 cs = 0x4650
    EXPECT_EQ(encode_centiseconds(180000), (Bytes{0x50, 0x46, 0x00, 0x00}));
    EXPECT_EQ(encode_centiseconds(0), (Bytes{0, 0, 0, 0}));
    // sub-centisecond remainder truncates
    EXPECT_EQ(encode_centiseconds(1239), encode_centiseconds(1230));
}

TEST(Codec, CentisecondRoundTripWithinTenMs)
{
    for (std::uint64_t ms : {0ull, 9ull, 10ull, 999ull, 42424ull, 3600000ull})
    {
        auto back = decode_centiseconds(encode_centiseconds(ms));
        ASSERT_TRUE(back.has_value());
        EXPECT_LE(ms - *back, 10u) << ms;
        EXPECT_LE(*back, ms);
    }
    EXPECT_FALSE(decode_centiseconds(Bytes{1}).has_value());
}

TEST(Codec, CentisecondsSaturate)
{
    const std::uint64_t huge = std::numeric_limits<std::uint64_t>::max();
    EXPECT_EQ(encode_centiseconds(huge), (Bytes{0xFF, 0xFF, 0xFF, 0xFF}));
}

TEST(Codec, MediaState)
{
    EXPECT_EQ(encode_media_state(media::MediaState::Inactive), Bytes{0x00});
    EXPECT_EQ(encode_media_state(media::MediaState::Playing), Bytes{0x01});
    EXPECT_EQ(encode_media_state(media::MediaState::Paused), Bytes{0x02});
}

TEST(Codec, CallStateRecordHasIndexAndFlags)
{
    EXPECT_EQ(encode_call_state(call::CallState::Incoming), (Bytes{0x01, 0x01, 0x00}));
    EXPECT_EQ(encode_call_state(call::CallState::Active), (Bytes{0x01, 0x04, 0x00}));
    EXPECT_EQ(encode_call_state(call::CallState::Idle), (Bytes{0x01, 0x00, 0x00}));
}

TEST(Codec, TerminationRecord)
{
    EXPECT_EQ(encode_termination(call::TerminationReason::Unknown), (Bytes{0x01, 0x00}));
    EXPECT_EQ(encode_termination(call::TerminationReason::NoAnswer), (Bytes{0x01, 0x05}));
}

TEST(Codec, OpcodeIsFirstByteOnly)
{
    EXPECT_FALSE(decode_opcode(Bytes{}).has_value());
    EXPECT_EQ(decode_opcode(Bytes{0x02}).value(), 0x02);
    EXPECT_EQ(decode_opcode(Bytes{0x30, 0x07, 0x00}).value(), 0x30);
}

TEST(Codec, HexForLogs)
{
    EXPECT_EQ(to_hex(Bytes{}), "");
    EXPECT_EQ(to_hex(Bytes{0x01, 0x04, 0xff}), "01 04 ff");
}
