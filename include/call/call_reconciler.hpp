#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "call/call_metadata.hpp"
#include "util/scheduler.hpp"

namespace call
{

// One platform telephony report. The platform exposes IDLE/RINGING/OFFHOOK only, so the
// direction and the TBS state are reconstructed from the previous snapshot.
struct CallMetadataUpdate
{
    TelephonyState             state{TelephonyState::Idle};
    std::optional<std::string> phone_number;
    std::optional<std::string> caller_name;
};

// Turns the coarse telephony signal into TBS call snapshots.
// Runs on the scheduler's sequencing queue; the scheduler must outlive the reconciler.
class CallStateReconciler
{
  public:
    using Listener = std::function<void(const CallMetadata &)>;

    CallStateReconciler(sched::IScheduler &sched, Listener on_change);
    ~CallStateReconciler();

    CallStateReconciler(const CallStateReconciler &)            = delete;
    CallStateReconciler &operator=(const CallStateReconciler &) = delete;

    void on_telephony(const CallMetadataUpdate &u);
    void on_caller_name_hint(const std::string &name);

    const CallMetadata &current() const { return current_; }
    bool                watchdog_armed() const { return watchdog_ != sched::INVALID_TASK; }

  private:
    void on_idle();
    void on_ringing(const std::optional<std::string> &number);
    void on_offhook(const std::optional<std::string> &number);

    void        start_dialing(const std::optional<std::string> &number);
    void        go_active(const char *why);
    void        emit(CallMetadata next);
    std::string new_call_id();
    void        arm_watchdog();
    void        disarm_watchdog();

    sched::IScheduler         &sched_;
    Listener                   on_change_;
    CallMetadata               current_;
    std::optional<std::string> last_number_;
    std::string                last_call_id_;
    unsigned                   id_seq_{0};
    sched::TaskId              watchdog_{sched::INVALID_TASK};
};

}  // namespace call
