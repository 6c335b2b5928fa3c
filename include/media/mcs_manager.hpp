#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "gatt/device_registry.hpp"
#include "gatt/igatt.hpp"
#include "gatt/notify_gate.hpp"
#include "media/media_metadata.hpp"

namespace media
{

// Media Control Point opcodes as understood by this server
namespace opcode
{
inline constexpr std::uint8_t PLAY         = 0x01;
inline constexpr std::uint8_t PAUSE        = 0x02;
inline constexpr std::uint8_t STOP         = 0x03;
inline constexpr std::uint8_t NEXT         = 0x04;
inline constexpr std::uint8_t PREVIOUS     = 0x05;
inline constexpr std::uint8_t REWIND       = 0x10;
inline constexpr std::uint8_t FAST_FORWARD = 0x11;
inline constexpr std::uint8_t GOTO         = 0x30;
}  // namespace opcode

// TI peripheral aliases -> opcode table above. Identity for anything not aliased.
std::uint8_t remap_vendor_opcode(std::uint8_t raw);

bool                        is_supported_opcode(std::uint8_t op);
std::optional<MediaCommand> command_for_opcode(std::uint8_t op);

// MCS "Media Control Point Opcodes Supported" bitmask for the set above
std::uint32_t supported_opcodes_bitmask();

// "com.spotify.music" -> "Spotify", unknown packages -> capitalized last segment
std::string player_name_for_package(std::string_view pkg);

// Owns the MCS service table, the media snapshot and the value cache in front of the server.
class McsManager
{
  public:
    McsManager(gatt::IGattServer &server, IMediaSource &source);

    gatt::ServiceDef service_definition() const;

    // readable values after (re)registration, no notifications
    void seed_values();

    void update(const MediaMetadata &m, const gatt::DeviceRegistry &reg);
    void publish_snapshot(const gatt::DeviceRegistry &reg);

    gatt::ControlResult handle_control_point(const gatt::Bytes &value);

    const std::optional<MediaMetadata> &current() const { return current_; }
    std::uint8_t                        track_counter() const { return track_counter_; }

  private:
    MediaMetadata snapshot() const;
    void          publish_all(const MediaMetadata &m, const gatt::DeviceRegistry &reg);

    gatt::IGattServer         &server_;
    IMediaSource              &source_;
    gatt::NotificationGate     gate_;
    std::optional<MediaMetadata> current_;
    std::optional<std::string> last_title_;
    std::uint8_t               track_counter_{0};
};

}  // namespace media
