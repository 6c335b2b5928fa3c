#include "call/call_metadata.hpp"

namespace call
{

const char *call_state_name(CallState s)
{
    switch (s)
    {
        case CallState::Idle:
            return "IDLE";
        case CallState::Incoming:
            return "INCOMING";
        case CallState::Dialing:
            return "DIALING";
        case CallState::Alerting:
            return "ALERTING";
        case CallState::Active:
            return "ACTIVE";
        case CallState::LocallyHeld:
            return "LOCALLY_HELD";
        case CallState::RemotelyHeld:
            return "REMOTELY_HELD";
        case CallState::LocallyAndRemotelyHeld:
            return "LOCALLY_AND_REMOTELY_HELD";
    }
    return "?";
}

const char *termination_name(TerminationReason r)
{
    switch (r)
    {
        case TerminationReason::Unknown:
            return "UNKNOWN";
        case TerminationReason::LocalParty:
            return "LOCAL_PARTY";
        case TerminationReason::RemoteParty:
            return "REMOTE_PARTY";
        case TerminationReason::Network:
            return "NETWORK";
        case TerminationReason::Busy:
            return "BUSY";
        case TerminationReason::NoAnswer:
            return "NO_ANSWER";
    }
    return "?";
}

const char *telephony_state_name(TelephonyState s)
{
    switch (s)
    {
        case TelephonyState::Idle:
            return "IDLE";
        case TelephonyState::Ringing:
            return "RINGING";
        case TelephonyState::Offhook:
            return "OFFHOOK";
    }
    return "?";
}

const char *call_command_name(CallCommand c)
{
    switch (c)
    {
        case CallCommand::Accept:
            return "accept";
        case CallCommand::Reject:
            return "reject";
        case CallCommand::End:
            return "end";
        case CallCommand::Hold:
            return "hold";
        case CallCommand::Unhold:
            return "unhold";
    }
    return "?";
}

}  // namespace call
