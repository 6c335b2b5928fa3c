#include "gatt/characteristics.hpp"

#include "gatt/igatt.hpp"
#include "util/constants.hpp"

namespace gatt
{

namespace
{
struct CharInfo
{
    CharId        id;
    std::uint16_t uuid16;
    const char   *name;
};

constexpr CharInfo kChars[] = {
    {CharId::DeviceName, constants::GAP_DEVICE_NAME, "DeviceName"},
    {CharId::Appearance, constants::GAP_APPEARANCE, "Appearance"},
    {CharId::PlayerName, constants::MCS_PLAYER_NAME, "PlayerName"},
    {CharId::TrackChanged, constants::MCS_TRACK_CHANGED, "TrackChanged"},
    {CharId::TrackTitle, constants::MCS_TRACK_TITLE, "TrackTitle"},
    {CharId::TrackDuration, constants::MCS_TRACK_DURATION, "TrackDuration"},
    {CharId::TrackPosition, constants::MCS_TRACK_POSITION, "TrackPosition"},
    {CharId::MediaState, constants::MCS_MEDIA_STATE, "MediaState"},
    {CharId::MediaControlPoint, constants::MCS_CONTROL_POINT, "MediaControlPoint"},
    {CharId::SupportedOpcodes, constants::MCS_OPCODES, "SupportedOpcodes"},
    {CharId::CallState, constants::TBS_CALL_STATE, "CallState"},
    {CharId::CallControlPoint, constants::TBS_CONTROL_POINT, "CallControlPoint"},
    {CharId::FriendlyName, constants::TBS_FRIENDLY_NAME, "FriendlyName"},
    {CharId::TerminationReason, constants::TBS_TERMINATION_REASON, "TerminationReason"},
};
}  // namespace

const char *char_name(CharId id)
{
    for (const auto &c : kChars)
    {
        if (c.id == id)
            return c.name;
    }
    return "?";
}

std::optional<CharId> char_from_uuid16(std::uint16_t uuid16)
{
    for (const auto &c : kChars)
    {
        if (c.uuid16 == uuid16)
            return c.id;
    }
    return std::nullopt;
}

std::vector<std::string> flag_names(std::uint8_t flags)
{
    std::vector<std::string> out;
    if (flags & FLAG_READ)
        out.emplace_back("read");
    if (flags & FLAG_WRITE)
        out.emplace_back("write");
    if (flags & FLAG_WRITE_NO_RSP)
        out.emplace_back("write-without-response");
    if (flags & FLAG_NOTIFY)
        out.emplace_back("notify");
    return out;
}

ServiceDef gap_service_definition()
{
    return ServiceDef{constants::GAP_SVC,
                      "GAP",
                      {
                          {CharId::DeviceName, constants::GAP_DEVICE_NAME, FLAG_READ},
                          {CharId::Appearance, constants::GAP_APPEARANCE, FLAG_READ},
                      }};
}

const char *control_result_name(ControlResult r)
{
    switch (r)
    {
        case ControlResult::Dispatched:
            return "dispatched";
        case ControlResult::Failed:
            return "failed";
        case ControlResult::Unsupported:
            return "unsupported";
        case ControlResult::Malformed:
            return "malformed";
    }
    return "?";
}

}  // namespace gatt
