#include "media/mcs_manager.hpp"

#include <cctype>

#include "proto/codec.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace media
{

namespace
{
std::string lower(std::string_view s)
{
    std::string out(s);
    for (auto &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool has(const std::string &hay, const char *needle)
{
    return hay.find(needle) != std::string::npos;
}
}  // namespace

std::uint8_t remap_vendor_opcode(std::uint8_t raw)
{
    switch (raw)
    {
        case 0x30:  // TI alias for Previous Track
            return opcode::PREVIOUS;
        case 0x31:  // TI "next track"
            return opcode::NEXT;
        case 0x32:
            return opcode::PREVIOUS;
        case 0x33:
            return opcode::PLAY;
        case 0x34:
            return opcode::PAUSE;
        default:
            return raw;
    }
}

bool is_supported_opcode(std::uint8_t op)
{
    switch (op)
    {
        case opcode::PLAY:
        case opcode::PAUSE:
        case opcode::STOP:
        case opcode::NEXT:
        case opcode::PREVIOUS:
        case opcode::REWIND:
        case opcode::FAST_FORWARD:
        case opcode::GOTO:
            return true;
        default:
            return false;
    }
}

std::optional<MediaCommand> command_for_opcode(std::uint8_t op)
{
    switch (op)
    {
        case opcode::PLAY:
            return MediaCommand::Play;
        case opcode::PAUSE:
            return MediaCommand::Pause;
        case opcode::STOP:
            return MediaCommand::Stop;
        case opcode::NEXT:
            return MediaCommand::Next;
        case opcode::PREVIOUS:
            return MediaCommand::Previous;
        case opcode::REWIND:
            return MediaCommand::Rewind;
        case opcode::FAST_FORWARD:
            return MediaCommand::FastForward;
        default:
            return std::nullopt;  // GOTO carries a track parameter we do not decode
    }
}

std::uint32_t supported_opcodes_bitmask()
{
    // bit positions from the MCS opcode support table
    constexpr std::uint32_t PLAY_BIT      = 1u << 0;
    constexpr std::uint32_t PAUSE_BIT     = 1u << 1;
    constexpr std::uint32_t REWIND_BIT    = 1u << 2;
    constexpr std::uint32_t FF_BIT        = 1u << 3;
    constexpr std::uint32_t STOP_BIT      = 1u << 4;
    constexpr std::uint32_t PREV_TRK_BIT  = 1u << 11;
    constexpr std::uint32_t NEXT_TRK_BIT  = 1u << 12;
    constexpr std::uint32_t GOTO_TRK_BIT  = 1u << 15;
    return PLAY_BIT | PAUSE_BIT | REWIND_BIT | FF_BIT | STOP_BIT | PREV_TRK_BIT | NEXT_TRK_BIT |
           GOTO_TRK_BIT;
}

std::string player_name_for_package(std::string_view pkg)
{
    if (pkg.empty())
        return std::string(constants::DEFAULT_PLAYER_NAME);

    const std::string p = lower(pkg);
    if (has(p, "spotify"))
        return "Spotify";
    if (has(p, "youtube"))
        return "YouTube Music";
    if (has(p, "music"))
    {
        if (has(p, "google"))
            return "YouTube Music";
        if (has(p, "apple"))
            return "Apple Music";
        return "Music";
    }
    if (has(p, "soundcloud"))
        return "SoundCloud";
    if (has(p, "pandora"))
        return "Pandora";
    if (has(p, "deezer"))
        return "Deezer";

    std::string tail(pkg);
    auto        dot = tail.rfind('.');
    if (dot != std::string::npos)
        tail = tail.substr(dot + 1);
    if (tail.empty())
        return std::string(constants::DEFAULT_PLAYER_NAME);
    tail[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(tail[0])));
    return tail;
}

McsManager::McsManager(gatt::IGattServer &server, IMediaSource &source)
    : server_(server), source_(source)
{
}

gatt::ServiceDef McsManager::service_definition() const
{
    using namespace gatt;
    const std::uint8_t RN = FLAG_READ | FLAG_NOTIFY;
    return ServiceDef{
        constants::MCS_SVC,
        "MCS",
        {
            {CharId::PlayerName, constants::MCS_PLAYER_NAME, RN},
            {CharId::TrackChanged, constants::MCS_TRACK_CHANGED, FLAG_NOTIFY},
            {CharId::TrackTitle, constants::MCS_TRACK_TITLE, RN},
            {CharId::TrackDuration, constants::MCS_TRACK_DURATION, RN},
            {CharId::TrackPosition, constants::MCS_TRACK_POSITION, RN},
            {CharId::MediaState, constants::MCS_MEDIA_STATE, RN},
            {CharId::MediaControlPoint, constants::MCS_CONTROL_POINT,
             FLAG_WRITE | FLAG_WRITE_NO_RSP | FLAG_NOTIFY},
            {CharId::SupportedOpcodes, constants::MCS_OPCODES, RN},
        }};
}

MediaMetadata McsManager::snapshot() const
{
    // no title yet: Title reads "No Media" and Media State stays Inactive
    return current_ ? *current_ : MediaMetadata{};
}

void McsManager::seed_values()
{
    const MediaMetadata m = snapshot();
    bool ok = server_.set_value(gatt::CharId::PlayerName,
                                codec::encode_string(player_name_for_package(
                                    m.source_package.value_or(std::string()))));
    ok &= server_.set_value(gatt::CharId::TrackTitle,
                            codec::encode_string(m.title.value_or(
                                std::string(constants::DEFAULT_TRACK_TITLE))));
    ok &= server_.set_value(gatt::CharId::TrackDuration, codec::encode_centiseconds(m.duration_ms));
    ok &= server_.set_value(gatt::CharId::TrackPosition, codec::encode_centiseconds(m.position_ms));
    ok &= server_.set_value(gatt::CharId::MediaState,
                            codec::encode_media_state(derive_media_state(m)));
    ok &= server_.set_value(gatt::CharId::SupportedOpcodes,
                            codec::encode_u32_le(supported_opcodes_bitmask()));
    if (!ok)
        LOG_WARN("[MCS] some readable values could not be stored");
}

void McsManager::update(const MediaMetadata &m, const gatt::DeviceRegistry &reg)
{
    LOG_INFO("[MCS] update: title='%s' pkg=%s playing=%d dur=%llums pos=%llums",
             m.title ? m.title->c_str() : "(none)",
             m.source_package ? m.source_package->c_str() : "(none)", (int)m.is_playing,
             (unsigned long long)m.duration_ms, (unsigned long long)m.position_ms);

    if (m.title != last_title_)
    {
        ++track_counter_;  // u8, wraps
        last_title_ = m.title;
        LOG_DEBUG("[MCS] track changed, counter=%u", (unsigned)track_counter_);
    }
    current_ = m;
    publish_all(m, reg);
}

void McsManager::publish_snapshot(const gatt::DeviceRegistry &reg)
{
    const MediaMetadata m = snapshot();
    publish_all(m, reg);
    gate_.publish(server_, gatt::CharId::SupportedOpcodes,
                  codec::encode_u32_le(supported_opcodes_bitmask()), reg);
}

void McsManager::publish_all(const MediaMetadata &m, const gatt::DeviceRegistry &reg)
{
    using gatt::CharId;
    gate_.publish(server_, CharId::TrackChanged, codec::encode_u8(track_counter_), reg);
    gate_.publish(server_, CharId::TrackTitle,
                  codec::encode_string(
                      m.title.value_or(std::string(constants::DEFAULT_TRACK_TITLE))),
                  reg);
    gate_.publish(server_, CharId::TrackDuration, codec::encode_centiseconds(m.duration_ms), reg);
    gate_.publish(server_, CharId::TrackPosition, codec::encode_centiseconds(m.position_ms), reg);
    gate_.publish(server_, CharId::PlayerName,
                  codec::encode_string(
                      player_name_for_package(m.source_package.value_or(std::string()))),
                  reg);
    gate_.publish(server_, CharId::MediaState, codec::encode_media_state(derive_media_state(m)),
                  reg);
}

// ======================================================================
// Function: McsManager::handle_control_point
// - In: raw bytes written to the Media Control Point
// - Out: Dispatched when the media source accepted the command
// - Note: vendor aliases are remapped before the supported-set check
// ======================================================================
gatt::ControlResult McsManager::handle_control_point(const gatt::Bytes &value)
{
    auto raw = codec::decode_opcode(value);
    if (!raw)
    {
        LOG_WARN("[MCS] empty control point write");
        return gatt::ControlResult::Malformed;
    }

    const std::uint8_t op = remap_vendor_opcode(*raw);
    if (op != *raw)
        LOG_DEBUG("[MCS] vendor opcode 0x%02x -> 0x%02x", (unsigned)*raw, (unsigned)op);

    if (!is_supported_opcode(op))
    {
        LOG_WARN("[MCS] unsupported opcode 0x%02x dropped", (unsigned)op);
        return gatt::ControlResult::Unsupported;
    }

    auto cmd = command_for_opcode(op);
    if (!cmd)
    {
        LOG_INFO("[MCS] opcode 0x%02x accepted but has no player action", (unsigned)op);
        return gatt::ControlResult::Failed;
    }

    const bool ok = source_.execute(*cmd);
    LOG_INFO("[MCS] control point 0x%02x -> %s (%s)", (unsigned)op, media_command_name(*cmd),
             ok ? "ok" : "failed");
    return ok ? gatt::ControlResult::Dispatched : gatt::ControlResult::Failed;
}

}  // namespace media
