#pragma once
#include <cstdint>
#include <optional>
#include <string>

#include "call/call_metadata.hpp"
#include "gatt/device_registry.hpp"
#include "gatt/igatt.hpp"
#include "gatt/notify_gate.hpp"
#include "util/constants.hpp"

namespace call
{

namespace opcode
{
inline constexpr std::uint8_t ACCEPT    = 0x01;
inline constexpr std::uint8_t TERMINATE = 0x02;  // reject while ringing
inline constexpr std::uint8_t END       = 0x03;
inline constexpr std::uint8_t HOLD      = 0x04;
inline constexpr std::uint8_t UNHOLD    = 0x05;
}  // namespace opcode

// Owns the TBS service table and pushes reconciled call snapshots to the peers.
class TbsManager
{
  public:
    TbsManager(gatt::IGattServer &server, ITelephony &telephony);

    gatt::ServiceDef service_definition() const;
    void             seed_values();

    void update(const CallMetadata &m, const gatt::DeviceRegistry &reg);
    void publish_snapshot(const gatt::DeviceRegistry &reg);

    gatt::ControlResult handle_control_point(const gatt::Bytes &value);

    const std::optional<CallMetadata> &current() const { return current_; }

  private:
    void publish_termination(const CallMetadata &m, const gatt::DeviceRegistry &reg);

    gatt::IGattServer          &server_;
    ITelephony                 &telephony_;
    gatt::NotificationGate      gate_;
    std::optional<CallMetadata> current_;
    std::string                 idle_name_{constants::DEFAULT_FRIENDLY_NAME};  // Friendly Name while idle
};

}  // namespace call
