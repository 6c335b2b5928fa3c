/*
 * Telephony reconciliation
 *
 *   platform signal          previous snapshot          emitted snapshot
 *   ---------------          -----------------          ----------------
 *   RINGING            +     IDLE               ->      INCOMING   (new id, "Incoming Call")
 *   RINGING            +     INCOMING           ->      INCOMING   (number refresh only)
 *   OFFHOOK            +     IDLE               ->      DIALING    (new id, watchdog armed)
 *   OFFHOOK            +     INCOMING           ->      ACTIVE
 *   OFFHOOK            +     DIALING  (>500ms)  ->      ACTIVE
 *   OFFHOOK            +     ACTIVE   (>1000ms) ->      DIALING    (new id, watchdog armed)
 *   IDLE               +     any non-IDLE       ->      IDLE       (termination reason)
 *   watchdog (5s)      +     DIALING, same id   ->      ACTIVE
 */
#include "call/call_reconciler.hpp"

#include <cctype>
#include <utility>

#include "call/caller_name.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace call
{

namespace
{
std::optional<std::string> normalize_number(const std::optional<std::string> &n)
{
    if (!n)
        return std::nullopt;
    std::string s = strip_bidi(*n);
    auto        l = s.find_first_not_of(" \t");
    if (l == std::string::npos)
        return std::nullopt;
    s = s.substr(l, s.find_last_not_of(" \t") - l + 1);

    std::string low = s;
    for (auto &c : low)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (low == "unknown" || low == "null")
        return std::nullopt;
    return s;
}
}  // namespace

CallStateReconciler::CallStateReconciler(sched::IScheduler &sched, Listener on_change)
    : sched_(sched), on_change_(std::move(on_change))
{
    current_.timestamp_ms = sched_.now_ms();
}

CallStateReconciler::~CallStateReconciler()
{
    disarm_watchdog();
}

void CallStateReconciler::on_telephony(const CallMetadataUpdate &u)
{
    const auto number = normalize_number(u.phone_number);
    LOG_INFO("[CALL] telephony %s (prev=%s number=%s)", telephony_state_name(u.state),
             call_state_name(current_.state), number ? number->c_str() : "(none)");

    switch (u.state)
    {
        case TelephonyState::Idle:
            on_idle();
            break;
        case TelephonyState::Ringing:
            on_ringing(number);
            break;
        case TelephonyState::Offhook:
            on_offhook(number);
            break;
    }

    if (u.caller_name)
        on_caller_name_hint(*u.caller_name);
}

void CallStateReconciler::on_idle()
{
    disarm_watchdog();

    if (is_idle(current_.state))
    {
        CallMetadata plain;
        plain.timestamp_ms = current_.timestamp_ms;
        if (current_ == plain)
        {
            LOG_DEBUG("[CALL] IDLE while idle, nothing to do");
            return;
        }
        plain.timestamp_ms = sched_.now_ms();
        emit(plain);
        return;
    }

    CallMetadata next = current_;
    next.state        = CallState::Idle;
    next.termination_reason =
        is_connected_state(current_.state) ? TerminationReason::Unknown : TerminationReason::NoAnswer;
    if (!next.phone_number)
        next.phone_number = last_number_;
    next.timestamp_ms = sched_.now_ms();

    LOG_INFO("[CALL] %s ended from %s, reason=%s", next.call_id ? next.call_id->c_str() : "?",
             call_state_name(current_.state), termination_name(*next.termination_reason));
    last_number_.reset();
    emit(std::move(next));
}

void CallStateReconciler::on_ringing(const std::optional<std::string> &number)
{
    if (number)
        last_number_ = number;

    if (is_idle(current_.state))
    {
        CallMetadata next;
        next.state        = CallState::Incoming;
        next.phone_number = number;
        next.caller_name  = std::string(INCOMING_PLACEHOLDER);
        next.call_id      = new_call_id();
        next.is_incoming  = true;
        next.timestamp_ms = sched_.now_ms();
        emit(std::move(next));
        return;
    }

    if (current_.state == CallState::Incoming)
    {
        if (number && number != current_.phone_number)
        {
            CallMetadata next = current_;
            next.phone_number = number;
            emit(std::move(next));
        }
        return;
    }

    // single-call model: a waiting call does not replace the current one
    LOG_DEBUG("[CALL] RINGING during %s ignored", call_state_name(current_.state));
}

void CallStateReconciler::on_offhook(const std::optional<std::string> &number)
{
    if (number)
        last_number_ = number;

    const std::uint64_t now   = sched_.now_ms();
    const std::uint64_t since = now - current_.timestamp_ms;

    switch (current_.state)
    {
        case CallState::Idle:
            start_dialing(number);
            break;
        case CallState::Incoming:
            go_active("answered");
            break;
        case CallState::Dialing:
        case CallState::Alerting:
            if (since > constants::DIAL_ANSWER_MIN_MS)
                go_active("remote answered");
            else
                LOG_DEBUG("[CALL] OFFHOOK %llums after dialing ignored", (unsigned long long)since);
            break;
        case CallState::Active:
        case CallState::LocallyHeld:
        case CallState::RemotelyHeld:
        case CallState::LocallyAndRemotelyHeld:
            if (since > constants::NEW_CALL_MIN_GAP_MS)
                start_dialing(number);
            else
                LOG_DEBUG("[CALL] duplicate OFFHOOK %llums into call ignored",
                          (unsigned long long)since);
            break;
    }
}

void CallStateReconciler::start_dialing(const std::optional<std::string> &number)
{
    CallMetadata next;
    next.state        = CallState::Dialing;
    next.phone_number = number;
    next.caller_name  = std::string(OUTGOING_PLACEHOLDER);
    next.call_id      = new_call_id();
    next.is_incoming  = false;
    next.timestamp_ms = sched_.now_ms();
    emit(std::move(next));
    arm_watchdog();
}

void CallStateReconciler::go_active(const char *why)
{
    disarm_watchdog();
    CallMetadata next = current_;
    next.state        = CallState::Active;
    next.timestamp_ms = sched_.now_ms();
    LOG_INFO("[CALL] %s -> ACTIVE (%s)", next.call_id ? next.call_id->c_str() : "?", why);
    emit(std::move(next));
}

void CallStateReconciler::on_caller_name_hint(const std::string &name)
{
    if (is_idle(current_.state))
    {
        LOG_DEBUG("[CALL] name hint while idle ignored");
        return;
    }
    if (!should_replace_name(current_.caller_name, name))
    {
        LOG_DEBUG("[CALL] name hint '%s' rejected (current '%s')", name.c_str(),
                  current_.caller_name ? current_.caller_name->c_str() : "");
        return;
    }

    CallMetadata next = current_;
    next.caller_name  = strip_bidi(name);
    LOG_INFO("[CALL] caller name -> '%s'", next.caller_name->c_str());
    emit(std::move(next));
}

void CallStateReconciler::emit(CallMetadata next)
{
    current_ = std::move(next);
    if (on_change_)
        on_change_(current_);
}

std::string CallStateReconciler::new_call_id()
{
    std::string id = "call_" + std::to_string(sched_.now_ms());
    if (id == last_call_id_)
        return id + "_" + std::to_string(++id_seq_);  // same millisecond
    last_call_id_ = id;
    id_seq_       = 0;
    return id;
}

// ======================================================================
// Function: CallStateReconciler::arm_watchdog
// - In: none (uses the current DIALING snapshot)
// - Out: none
// - Note: some platforms never report the remote answer; after 5 s a still-dialing call
//         with the same id is promoted to ACTIVE
// ======================================================================
void CallStateReconciler::arm_watchdog()
{
    disarm_watchdog();
    const std::string id = current_.call_id.value_or(std::string());
    watchdog_ = sched_.post_after(constants::DIAL_WATCHDOG_MS, [this, id]() {
        watchdog_ = sched::INVALID_TASK;
        if (current_.state != CallState::Dialing || current_.call_id.value_or("") != id)
        {
            LOG_DEBUG("[CALL] stale dial watchdog for %s discarded", id.c_str());
            return;
        }
        go_active("dial watchdog");
    });
}

void CallStateReconciler::disarm_watchdog()
{
    if (watchdog_ != sched::INVALID_TASK)
    {
        sched_.cancel(watchdog_);
        watchdog_ = sched::INVALID_TASK;
    }
}

}  // namespace call
