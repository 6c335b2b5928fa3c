#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "app/capabilities.hpp"
#include "call/call_reconciler.hpp"
#include "call/tbs_manager.hpp"
#include "gatt/device_registry.hpp"
#include "gatt/igatt.hpp"
#include "media/mcs_manager.hpp"
#include "util/constants.hpp"
#include "util/scheduler.hpp"

namespace app
{

enum class SessionState
{
    Idle,
    ServerStarting,
    ServerReady,
    ClientConnecting,
    Connected,
    Disconnecting,
    CooldownPending,
};

const char *session_state_name(SessionState s);

enum class EventKind
{
    DeviceConnected,
    DeviceDisconnected,
    ServiceRegistered,
    CharacteristicWritten,
    SubscriptionChanged,
    ClientConnected,
    ClientDisconnected,
    MetadataUpdated,
};

const char *event_kind_name(EventKind k);

// Everything that can change session state, as one value posted to the sequencing queue.
struct SessionEvent
{
    EventKind kind{EventKind::MetadataUpdated};

    std::string device;  // peer or client address

    // ServiceRegistered
    std::uint16_t             service{0};
    bool                      ok{false};
    std::vector<gatt::CharId> chars;

    // CharacteristicWritten / SubscriptionChanged
    gatt::CharId characteristic{gatt::CharId::DeviceName};
    gatt::Bytes  value;
    bool         enabled{false};

    // MetadataUpdated (exactly one set)
    std::optional<media::MediaMetadata>     media;
    std::optional<call::CallMetadataUpdate> call;
    std::optional<std::string>              name_hint;
};

struct SessionOptions
{
    std::uint32_t connect_delay_ms{constants::CLIENT_CONNECT_DELAY_MS};
    std::uint32_t cooldown_ms{constants::SERVER_COOLDOWN_MS};
    std::string   device_name{constants::DEFAULT_DEVICE_NAME};
};

// Owns the GATT server lifecycle and the client link to one peripheral.
//
// Public entry points may be called from any thread; they only post to the scheduler.
// Everything else (dispatch, managers, registry) runs on the scheduler's queue.
class GattSession
{
  public:
    GattSession(gatt::IGattServer   &server,
                gatt::IGattClient   &client,
                sched::IScheduler   &sched,
                media::IMediaSource &media_source,
                call::ITelephony    &telephony,
                const ICapabilities &caps,
                SessionOptions       opts = {});
    ~GattSession();

    GattSession(const GattSession &)            = delete;
    GattSession &operator=(const GattSession &) = delete;

    bool connect(const std::string &addr);  // false: malformed address
    void disconnect();
    void on_media_update(const media::MediaMetadata &m);
    void on_call_update(const call::CallMetadataUpdate &u);
    void on_caller_name_hint(const std::string &name);
    void request_status();
    void post(SessionEvent ev);

    // queue thread only
    SessionState                state() const { return state_; }
    std::string                 status_report() const;
    const gatt::DeviceRegistry &registry() const { return registry_; }
    const std::set<std::uint16_t> &degraded_services() const { return degraded_; }
    const media::McsManager    &mcs() const { return mcs_; }
    const call::TbsManager     &tbs() const { return tbs_; }
    const std::string          &target() const { return target_; }
    const call::CallMetadata   &call_state() const { return reconciler_.current(); }

  private:
    void dispatch(const SessionEvent &ev);

    void do_connect(const std::string &addr);
    void do_disconnect();
    bool start_server();
    void begin_client_connect();
    void teardown(const char *why);
    void set_state(SessionState s);

    void on_service_registered(const SessionEvent &ev);
    void on_device_connected(const std::string &dev);
    void on_device_disconnected(const std::string &dev);
    void on_characteristic_written(const SessionEvent &ev);
    void on_client_connected(const std::string &addr);
    void on_client_disconnected(const std::string &addr);
    void on_metadata(const SessionEvent &ev);

    void send_burst(const std::string &dev);
    void schedule_monitor(const std::string &dev, int check, std::uint32_t delay_ms);
    void check_subscriptions(const std::string &dev, int check);
    void cancel_device_tasks(const std::string &dev);
    void cancel_all_device_tasks();
    void cancel(sched::TaskId &id);

    void seed_gap_values();
    std::vector<gatt::ServiceDef> service_table() const;

    gatt::ServerCallbacks server_callbacks();
    gatt::ClientCallbacks client_callbacks();

    struct DeviceTasks
    {
        sched::TaskId burst{sched::INVALID_TASK};
        sched::TaskId monitor{sched::INVALID_TASK};
    };

    gatt::IGattServer   &server_;
    gatt::IGattClient   &client_;
    sched::IScheduler   &sched_;
    const ICapabilities &caps_;
    SessionOptions       opts_;

    media::McsManager         mcs_;
    call::TbsManager          tbs_;
    call::CallStateReconciler reconciler_;
    gatt::DeviceRegistry      registry_;

    SessionState                       state_{SessionState::Idle};
    std::uint64_t                      token_{0};       // connect/disconnect intent
    std::uint64_t                      server_gen_{0};  // one per server instance
    std::string                        target_;
    std::set<std::uint16_t>            registered_;
    std::set<std::uint16_t>            degraded_;
    std::map<std::string, DeviceTasks> device_tasks_;
    sched::TaskId                      connect_task_{sched::INVALID_TASK};
    sched::TaskId                      restart_task_{sched::INVALID_TASK};
};

}  // namespace app
