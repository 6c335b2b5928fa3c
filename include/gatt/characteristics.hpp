#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gatt
{

// Every characteristic this server exposes, across GAP, MCS and TBS.
enum class CharId : std::uint8_t
{
    DeviceName,
    Appearance,
    PlayerName,
    TrackChanged,
    TrackTitle,
    TrackDuration,
    TrackPosition,
    MediaState,
    MediaControlPoint,
    SupportedOpcodes,
    CallState,
    CallControlPoint,
    FriendlyName,
    TerminationReason,
};

enum CharFlag : std::uint8_t
{
    FLAG_READ         = 1u << 0,
    FLAG_WRITE        = 1u << 1,
    FLAG_WRITE_NO_RSP = 1u << 2,
    FLAG_NOTIFY       = 1u << 3,
};

struct CharDef
{
    CharId        id;
    std::uint16_t uuid16;
    std::uint8_t  flags;
};

struct ServiceDef
{
    std::uint16_t        uuid16;
    std::string          name;  // for logs: "GAP", "MCS", "TBS"
    std::vector<CharDef> chars;
};

const char              *char_name(CharId id);
std::optional<CharId>    char_from_uuid16(std::uint16_t uuid16);
std::vector<std::string> flag_names(std::uint8_t flags);  // BlueZ "Flags" strings

// Generic Access scaffolding: read-only Device Name and Appearance
ServiceDef gap_service_definition();

}  // namespace gatt
