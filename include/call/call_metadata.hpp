#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace call
{

// TBS Call State ordinals
enum class CallState : std::uint8_t
{
    Idle                    = 0x00,
    Incoming                = 0x01,
    Dialing                 = 0x02,
    Alerting                = 0x03,
    Active                  = 0x04,
    LocallyHeld             = 0x05,
    RemotelyHeld            = 0x06,
    LocallyAndRemotelyHeld  = 0x07,
};

enum class TerminationReason : std::uint8_t
{
    Unknown     = 0x00,
    LocalParty  = 0x01,
    RemoteParty = 0x02,
    Network     = 0x03,
    Busy        = 0x04,
    NoAnswer    = 0x05,
};

// Raw telephony signal as reported by the platform
enum class TelephonyState
{
    Idle,
    Ringing,
    Offhook,
};

enum class CallCommand
{
    Accept,
    Reject,
    End,
    Hold,
    Unhold,
};

struct CallMetadata
{
    std::optional<std::string>       phone_number;
    std::optional<std::string>       caller_name;
    CallState                        state{CallState::Idle};
    std::optional<std::string>       call_id;
    std::uint64_t                    timestamp_ms{0};
    std::optional<TerminationReason> termination_reason;
    bool                             is_incoming{false};

    bool operator==(const CallMetadata &o) const
    {
        return phone_number == o.phone_number && caller_name == o.caller_name &&
               state == o.state && call_id == o.call_id && timestamp_ms == o.timestamp_ms &&
               termination_reason == o.termination_reason && is_incoming == o.is_incoming;
    }
    bool operator!=(const CallMetadata &o) const { return !(*this == o); }
};

inline bool is_idle(CallState s)
{
    return s == CallState::Idle;
}

// ACTIVE or any held variant: the call was answered at some point
inline bool is_connected_state(CallState s)
{
    return s == CallState::Active || s == CallState::LocallyHeld ||
           s == CallState::RemotelyHeld || s == CallState::LocallyAndRemotelyHeld;
}

const char *call_state_name(CallState s);
const char *termination_name(TerminationReason r);
const char *telephony_state_name(TelephonyState s);
const char *call_command_name(CallCommand c);

// Executes call actions decoded from the Call Control Point.
struct ITelephony
{
    virtual bool supports(CallCommand cmd) const = 0;
    virtual bool execute(CallCommand cmd)        = 0;
    virtual ~ITelephony()                        = default;
};

}  // namespace call
