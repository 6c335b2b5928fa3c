#include <gtest/gtest.h>
#include <string>

#include "ctl/commands.hpp"

using ctl::CommandKind;
using ctl::parse_command;

TEST(Commands, ConnectNormalizesAddress)
{
    auto cmd = parse_command("connect aa:bb:cc:dd:ee:0f");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->kind, CommandKind::Connect);
    EXPECT_EQ(cmd->address, "AA:BB:CC:DD:EE:0F");
}

TEST(Commands, ConnectRejectsMalformedAddress)
{
    std::string err;
    EXPECT_FALSE(parse_command("CONNECT AA:BB:CC:DD:EE", &err).has_value());
    EXPECT_NE(err.find("invalid address"), std::string::npos);
    EXPECT_FALSE(parse_command("CONNECT").has_value());
}

TEST(Commands, BareVerbs)
{
    EXPECT_EQ(parse_command("DISCONNECT")->kind, CommandKind::Disconnect);
    EXPECT_EQ(parse_command("status\r")->kind, CommandKind::Status);
    EXPECT_EQ(parse_command("  QUIT ")->kind, CommandKind::Quit);

    std::string err;
    EXPECT_FALSE(parse_command("STATUS now", &err).has_value());
    EXPECT_EQ(err, "STATUS takes no arguments");
}

TEST(Commands, MediaFields)
{
    auto cmd = parse_command("MEDIA\ttitle=Song A\tartist=The Band\talbum=LP\tpkg=com.example.player"
                             "\tplaying=1\tduration=180000\tposition=42000");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->kind, CommandKind::Media);
    EXPECT_EQ(cmd->media.title.value_or(""), "Song A");
    EXPECT_EQ(cmd->media.artist, "The Band");
    EXPECT_EQ(cmd->media.album, "LP");
    EXPECT_EQ(cmd->media.source_package.value_or(""), "com.example.player");
    EXPECT_TRUE(cmd->media.is_playing);
    EXPECT_EQ(cmd->media.duration_ms, 180000u);
    EXPECT_EQ(cmd->media.position_ms, 42000u);
}

TEST(Commands, BareMediaMeansNothingPlaying)
{
    auto cmd = parse_command("MEDIA");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_FALSE(cmd->media.title.has_value());
    EXPECT_FALSE(cmd->media.is_playing);
    EXPECT_EQ(media::derive_media_state(cmd->media), media::MediaState::Inactive);
}

TEST(Commands, MediaRejectsBadFields)
{
    std::string err;
    EXPECT_FALSE(parse_command("MEDIA\tvolume=3", &err).has_value());
    EXPECT_EQ(err, "unknown media key 'volume'");
    EXPECT_FALSE(parse_command("MEDIA\tplaying=yes", &err).has_value());
    EXPECT_EQ(err, "playing expects 0 or 1");
    EXPECT_FALSE(parse_command("MEDIA\tduration=-1", &err).has_value());
    EXPECT_FALSE(parse_command("MEDIA\tjusttext", &err).has_value());
}

TEST(Commands, CallStates)
{
    auto ring = parse_command("CALL\tRINGING\t+15551234567");
    ASSERT_TRUE(ring.has_value());
    EXPECT_EQ(ring->kind, CommandKind::Call);
    EXPECT_EQ(ring->call.state, call::TelephonyState::Ringing);
    EXPECT_EQ(ring->call.phone_number.value_or(""), "+15551234567");
    EXPECT_FALSE(ring->call.caller_name.has_value());

    auto named = parse_command("CALL\tringing\t+15551234567\tJane Doe");
    ASSERT_TRUE(named.has_value());
    EXPECT_EQ(named->call.caller_name.value_or(""), "Jane Doe");

    auto idle = parse_command("CALL\tIDLE");
    ASSERT_TRUE(idle.has_value());
    EXPECT_EQ(idle->call.state, call::TelephonyState::Idle);
    EXPECT_FALSE(idle->call.phone_number.has_value());

    EXPECT_EQ(parse_command("CALL OFFHOOK")->call.state, call::TelephonyState::Offhook);
    EXPECT_FALSE(parse_command("CALL\tDIALING").has_value());
}

TEST(Commands, NameKeepsSpaces)
{
    auto cmd = parse_command("NAME\tJane  Doe ");
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->kind, CommandKind::Name);
    EXPECT_EQ(cmd->name, "Jane  Doe");
    EXPECT_FALSE(parse_command("NAME").has_value());
}

TEST(Commands, UnknownVerb)
{
    std::string err;
    EXPECT_FALSE(parse_command("SEND hi", &err).has_value());
    EXPECT_EQ(err, "unknown command 'SEND'");
    EXPECT_FALSE(parse_command("", &err).has_value());
    EXPECT_EQ(err, "empty line");
}

TEST(Commands, MediaLineJoinsWithTabs)
{
    EXPECT_EQ(ctl::media_line({}), "MEDIA");
    EXPECT_EQ(ctl::media_line({"title=A B", "playing=0"}), "MEDIA\ttitle=A B\tplaying=0");
}
