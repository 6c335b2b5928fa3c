#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace media
{

// MCS Media State values
enum class MediaState : std::uint8_t
{
    Inactive = 0x00,
    Playing  = 0x01,
    Paused   = 0x02,
};

enum class MediaCommand
{
    Play,
    Pause,
    Stop,
    Next,
    Previous,
    Rewind,
    FastForward,
};

struct MediaMetadata
{
    std::optional<std::string> title;
    std::string                artist;
    std::string                album;
    std::optional<std::string> source_package;
    bool                       is_playing{false};
    std::uint64_t              duration_ms{0};
    std::uint64_t              position_ms{0};
    std::uint64_t              timestamp_ms{0};

    bool operator==(const MediaMetadata &o) const
    {
        return title == o.title && artist == o.artist && album == o.album &&
               source_package == o.source_package && is_playing == o.is_playing &&
               duration_ms == o.duration_ms && position_ms == o.position_ms;
    }
    bool operator!=(const MediaMetadata &o) const { return !(*this == o); }
};

inline MediaState derive_media_state(const MediaMetadata &m)
{
    if (m.is_playing)
        return MediaState::Playing;
    if (m.title && !m.title->empty())
        return MediaState::Paused;
    return MediaState::Inactive;
}

inline const char *media_command_name(MediaCommand c)
{
    switch (c)
    {
        case MediaCommand::Play:
            return "play";
        case MediaCommand::Pause:
            return "pause";
        case MediaCommand::Stop:
            return "stop";
        case MediaCommand::Next:
            return "next";
        case MediaCommand::Previous:
            return "previous";
        case MediaCommand::Rewind:
            return "rewind";
        case MediaCommand::FastForward:
            return "fastforward";
    }
    return "?";
}

// Executes player commands decoded from the Media Control Point.
struct IMediaSource
{
    virtual bool execute(MediaCommand cmd) = 0;
    virtual ~IMediaSource()               = default;
};

}  // namespace media
