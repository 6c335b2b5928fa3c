#include "call/tbs_manager.hpp"

#include <string>

#include "call/caller_name.hpp"
#include "proto/codec.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace call
{

TbsManager::TbsManager(gatt::IGattServer &server, ITelephony &telephony)
    : server_(server), telephony_(telephony)
{
}

gatt::ServiceDef TbsManager::service_definition() const
{
    using namespace gatt;
    return ServiceDef{constants::TBS_SVC,
                      "TBS",
                      {
                          {CharId::CallState, constants::TBS_CALL_STATE, FLAG_READ | FLAG_NOTIFY},
                          {CharId::CallControlPoint, constants::TBS_CONTROL_POINT,
                           FLAG_WRITE | FLAG_WRITE_NO_RSP | FLAG_NOTIFY},
                          {CharId::FriendlyName, constants::TBS_FRIENDLY_NAME,
                           FLAG_READ | FLAG_NOTIFY},
                          {CharId::TerminationReason, constants::TBS_TERMINATION_REASON,
                           FLAG_NOTIFY},
                      }};
}

void TbsManager::seed_values()
{
    const CallState state = current_ ? current_->state : CallState::Idle;
    bool ok = server_.set_value(gatt::CharId::CallState, codec::encode_call_state(state));
    ok &= server_.set_value(gatt::CharId::FriendlyName,
                            codec::encode_string(current_ && !is_idle(state) ? display_name(*current_)
                                                                             : idle_name_));
    if (!ok)
        LOG_WARN("[TBS] some readable values could not be stored");
}

// ======================================================================
// Function: TbsManager::update
// - In: reconciled call snapshot, connected devices
// - Out: none
// - Note: a new call id forces Call State and Friendly Name past the cache;
//         entering IDLE sends Termination Reason, the last name, then Call State;
//         that last name is what idle snapshots carry afterwards
// ======================================================================
void TbsManager::update(const CallMetadata &m, const gatt::DeviceRegistry &reg)
{
    const std::optional<CallMetadata> prev = current_;
    current_                               = m;

    LOG_INFO("[TBS] %s id=%s name='%s' number=%s", call_state_name(m.state),
             m.call_id ? m.call_id->c_str() : "(none)", m.caller_name.value_or("").c_str(),
             m.phone_number.value_or("(none)").c_str());

    const bool ending = is_idle(m.state) && m.termination_reason && (!prev || !is_idle(prev->state));
    if (ending)
    {
        publish_termination(m, reg);
        return;
    }

    const bool new_call = m.call_id && (!prev || prev->call_id != m.call_id);
    gate_.publish(server_, gatt::CharId::CallState, codec::encode_call_state(m.state), reg,
                  new_call);
    if (is_idle(m.state))
        return;
    gate_.publish(server_, gatt::CharId::FriendlyName, codec::encode_string(display_name(m)), reg,
                  new_call);
}

void TbsManager::publish_termination(const CallMetadata &m, const gatt::DeviceRegistry &reg)
{
    const TerminationReason reason = *m.termination_reason;
    LOG_INFO("[TBS] termination %s for %s", termination_name(reason),
             m.call_id ? m.call_id->c_str() : "(none)");

    gate_.publish(server_, gatt::CharId::TerminationReason, codec::encode_termination(reason), reg,
                  true);
    gate_.publish(server_, gatt::CharId::FriendlyName, codec::encode_string(display_name(m)), reg,
                  true);
    gate_.publish(server_, gatt::CharId::CallState, codec::encode_call_state(CallState::Idle), reg);

    // the final name stays readable and in the gate cache until the next call replaces it
    idle_name_ = display_name(m);
}

void TbsManager::publish_snapshot(const gatt::DeviceRegistry &reg)
{
    const CallMetadata m = current_.value_or(CallMetadata{});
    gate_.publish(server_, gatt::CharId::CallState, codec::encode_call_state(m.state), reg);
    gate_.publish(server_, gatt::CharId::FriendlyName,
                  codec::encode_string(is_idle(m.state) ? idle_name_ : display_name(m)),
                  reg);
}

gatt::ControlResult TbsManager::handle_control_point(const gatt::Bytes &value)
{
    auto op = codec::decode_opcode(value);
    if (!op)
    {
        LOG_WARN("[TBS] empty control point write");
        return gatt::ControlResult::Malformed;
    }

    CallCommand cmd;
    switch (*op)
    {
        case opcode::ACCEPT:
            cmd = CallCommand::Accept;
            break;
        case opcode::TERMINATE:
            cmd = CallCommand::Reject;
            break;
        case opcode::END:
            cmd = CallCommand::End;
            break;
        case opcode::HOLD:
        case opcode::UNHOLD:
            LOG_INFO("[TBS] opcode 0x%02x (hold/unhold) not implemented", (unsigned)*op);
            return gatt::ControlResult::Failed;
        default:
            LOG_WARN("[TBS] unsupported opcode 0x%02x dropped", (unsigned)*op);
            return gatt::ControlResult::Unsupported;
    }

    if (!telephony_.supports(cmd))
    {
        LOG_WARN("[TBS] %s not available on this platform", call_command_name(cmd));
        return gatt::ControlResult::Failed;
    }
    const bool ok = telephony_.execute(cmd);
    LOG_INFO("[TBS] control point 0x%02x -> %s (%s)", (unsigned)*op, call_command_name(cmd),
             ok ? "ok" : "failed");
    return ok ? gatt::ControlResult::Dispatched : gatt::ControlResult::Failed;
}

}  // namespace call
