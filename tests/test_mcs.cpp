#include <gtest/gtest.h>
#include <vector>

#include "gatt/loopback_gatt.hpp"
#include "media/mcs_manager.hpp"
#include "proto/codec.hpp"

using namespace media;
using gatt::CharId;
using gatt::ControlResult;

namespace
{
struct RecordingSource : IMediaSource
{
    bool execute(MediaCommand cmd) override
    {
        seen.push_back(cmd);
        return ok;
    }
    std::vector<MediaCommand> seen;
    bool                      ok = true;
};

const char *DEV = "AA:BB:CC:DD:EE:FF";

struct McsFixture : ::testing::Test
{
    McsFixture() : mcs(server, source) {}

    void SetUp() override
    {
        ASSERT_TRUE(server.open({mcs.service_definition()}, gatt::ServerCallbacks{}));
        mcs.seed_values();
        reg.add(DEV);
    }

    MediaMetadata song(const char *title, bool playing)
    {
        MediaMetadata m;
        m.title          = title;
        m.artist         = "Artist";
        m.source_package = "com.spotify.music";
        m.is_playing     = playing;
        m.duration_ms    = 180000;
        m.position_ms    = 5000;
        return m;
    }

    gatt::LoopbackGattServer server;
    RecordingSource          source;
    gatt::DeviceRegistry     reg;
    McsManager               mcs;
};
}  // namespace

TEST(Mcs, VendorRemap)
{
    EXPECT_EQ(remap_vendor_opcode(0x30), opcode::PREVIOUS);
    EXPECT_EQ(remap_vendor_opcode(0x31), opcode::NEXT);
    EXPECT_EQ(remap_vendor_opcode(0x32), opcode::PREVIOUS);
    EXPECT_EQ(remap_vendor_opcode(0x33), opcode::PLAY);
    EXPECT_EQ(remap_vendor_opcode(0x34), opcode::PAUSE);
    EXPECT_EQ(remap_vendor_opcode(0x01), 0x01);
    EXPECT_EQ(remap_vendor_opcode(0x7F), 0x7F);
}

TEST(Mcs, SupportedOpcodesBitmask)
{
    EXPECT_EQ(supported_opcodes_bitmask(), 0x981Fu);
}

TEST(Mcs, PlayerNameFromPackage)
{
    EXPECT_EQ(player_name_for_package("com.spotify.music"), "Spotify");
    EXPECT_EQ(player_name_for_package("com.google.android.apps.youtube.music"), "YouTube Music");
    EXPECT_EQ(player_name_for_package("com.apple.android.music"), "Apple Music");
    EXPECT_EQ(player_name_for_package("com.example.podcasts"), "Podcasts");
    EXPECT_EQ(player_name_for_package(""), "MediaPlayer");
}

TEST(Mcs, MediaStateDerivation)
{
    MediaMetadata m;
    EXPECT_EQ(derive_media_state(m), MediaState::Inactive);
    m.title = "";
    EXPECT_EQ(derive_media_state(m), MediaState::Inactive);
    m.title = "Song";
    EXPECT_EQ(derive_media_state(m), MediaState::Paused);
    m.is_playing = true;
    EXPECT_EQ(derive_media_state(m), MediaState::Playing);
}

TEST_F(McsFixture, SeededValuesBeforeAnyUpdate)
{
    ASSERT_NE(server.value(CharId::TrackTitle), nullptr);
    EXPECT_EQ(codec::decode_string(*server.value(CharId::TrackTitle)), "No Media");
    EXPECT_EQ(*server.value(CharId::MediaState), codec::encode_u8(0x00));
    EXPECT_EQ(*server.value(CharId::SupportedOpcodes), codec::encode_u32_le(0x981F));
    EXPECT_EQ(codec::decode_string(*server.value(CharId::PlayerName)), "MediaPlayer");
}

TEST_F(McsFixture, UpdateNotifiesAllFieldsOnce)
{
    mcs.update(song("Song A", true), reg);

    EXPECT_EQ(server.sent_to(DEV, CharId::TrackTitle).size(), 1u);
    EXPECT_EQ(server.sent_to(DEV, CharId::TrackChanged).size(), 1u);
    EXPECT_EQ(server.sent_to(DEV, CharId::PlayerName).front(), codec::encode_string("Spotify"));
    EXPECT_EQ(server.sent_to(DEV, CharId::MediaState).front(), codec::encode_u8(0x01));
    EXPECT_EQ(server.sent_to(DEV, CharId::TrackDuration).front(), codec::encode_centiseconds(180000));
    EXPECT_EQ(mcs.track_counter(), 1u);
}

TEST_F(McsFixture, IdenticalUpdateIsIdempotent)
{
    mcs.update(song("Song A", true), reg);
    server.clear_sent();
    mcs.update(song("Song A", true), reg);
    EXPECT_TRUE(server.sent().empty());
    EXPECT_EQ(mcs.track_counter(), 1u);
}

TEST_F(McsFixture, PauseOnlySendsState)
{
    mcs.update(song("Song A", true), reg);
    server.clear_sent();
    mcs.update(song("Song A", false), reg);

    ASSERT_EQ(server.sent().size(), 1u);
    EXPECT_EQ(server.sent()[0].id, CharId::MediaState);
    EXPECT_EQ(server.sent()[0].value, codec::encode_u8(0x02));
}

TEST_F(McsFixture, NewTitleBumpsTrackChanged)
{
    mcs.update(song("Song A", true), reg);
    mcs.update(song("Song B", true), reg);
    EXPECT_EQ(mcs.track_counter(), 2u);
    auto changed = server.sent_to(DEV, CharId::TrackChanged);
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[1], codec::encode_u8(2));
}

TEST_F(McsFixture, SnapshotReachesOnlyNewDevice)
{
    mcs.update(song("Song A", true), reg);
    server.clear_sent();

    const char *NEW_DEV = "11:22:33:44:55:66";
    reg.add(NEW_DEV);
    reg.mark_recent(NEW_DEV);
    mcs.publish_snapshot(reg);
    reg.clear_recent(NEW_DEV);

    EXPECT_TRUE(server.sent_to(DEV, CharId::TrackTitle).empty());
    EXPECT_EQ(server.sent_to(NEW_DEV, CharId::TrackTitle).front(), codec::encode_string("Song A"));
    EXPECT_EQ(server.sent_to(NEW_DEV, CharId::MediaState).size(), 1u);
    EXPECT_EQ(server.sent_to(NEW_DEV, CharId::SupportedOpcodes).size(), 1u);
}

TEST_F(McsFixture, ControlPointDispatch)
{
    EXPECT_EQ(mcs.handle_control_point({0x01}), ControlResult::Dispatched);
    EXPECT_EQ(mcs.handle_control_point({0x02, 0xAA}), ControlResult::Dispatched);
    EXPECT_EQ(mcs.handle_control_point({0x31}), ControlResult::Dispatched);  // vendor next
    ASSERT_EQ(source.seen.size(), 3u);
    EXPECT_EQ(source.seen[0], MediaCommand::Play);
    EXPECT_EQ(source.seen[1], MediaCommand::Pause);
    EXPECT_EQ(source.seen[2], MediaCommand::Next);
}

TEST_F(McsFixture, ControlPointRejects)
{
    EXPECT_EQ(mcs.handle_control_point({}), ControlResult::Malformed);
    EXPECT_EQ(mcs.handle_control_point({0x40}), ControlResult::Unsupported);
    EXPECT_TRUE(source.seen.empty());

    source.ok = false;
    EXPECT_EQ(mcs.handle_control_point({0x03}), ControlResult::Failed);
    EXPECT_EQ(source.seen.back(), MediaCommand::Stop);
}
