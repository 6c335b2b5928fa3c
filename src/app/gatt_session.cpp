/*
 * Session lifecycle
 *
 *   connect(addr)                      peer subscribes / writes
 *        |                                      |
 *        v                                      v
 *   [ServerStarting] --all services--> [ServerReady]
 *        |                                      |
 *        +------ 100 ms barrier ----------------+
 *                       |
 *                       v
 *              [ClientConnecting] --link up--> [Connected] --pair/discover-->
 *                       |                          |
 *                       +------ link lost / disconnect() ------+
 *                                                              v
 *                                   [Disconnecting] -> close server, clear registry
 *                                                              |
 *                                                              v
 *                                   [CooldownPending] --800 ms--> [ServerStarting]
 *
 * Backend callbacks (any thread) are turned into SessionEvent values and posted to the
 * scheduler; dispatch() is the only place that mutates session state.
 */
#include "app/gatt_session.hpp"

#include <cstdio>
#include <sstream>
#include <utility>

#include "util/address.hpp"
#include "util/log.hpp"

namespace app
{

const char *session_state_name(SessionState s)
{
    switch (s)
    {
        case SessionState::Idle:
            return "Idle";
        case SessionState::ServerStarting:
            return "ServerStarting";
        case SessionState::ServerReady:
            return "ServerReady";
        case SessionState::ClientConnecting:
            return "ClientConnecting";
        case SessionState::Connected:
            return "Connected";
        case SessionState::Disconnecting:
            return "Disconnecting";
        case SessionState::CooldownPending:
            return "CooldownPending";
    }
    return "?";
}

const char *event_kind_name(EventKind k)
{
    switch (k)
    {
        case EventKind::DeviceConnected:
            return "DeviceConnected";
        case EventKind::DeviceDisconnected:
            return "DeviceDisconnected";
        case EventKind::ServiceRegistered:
            return "ServiceRegistered";
        case EventKind::CharacteristicWritten:
            return "CharacteristicWritten";
        case EventKind::SubscriptionChanged:
            return "SubscriptionChanged";
        case EventKind::ClientConnected:
            return "ClientConnected";
        case EventKind::ClientDisconnected:
            return "ClientDisconnected";
        case EventKind::MetadataUpdated:
            return "MetadataUpdated";
    }
    return "?";
}

GattSession::GattSession(gatt::IGattServer   &server,
                         gatt::IGattClient   &client,
                         sched::IScheduler   &sched,
                         media::IMediaSource &media_source,
                         call::ITelephony    &telephony,
                         const ICapabilities &caps,
                         SessionOptions       opts)
    : server_(server),
      client_(client),
      sched_(sched),
      caps_(caps),
      opts_(std::move(opts)),
      mcs_(server, media_source),
      tbs_(server, telephony),
      reconciler_(sched, [this](const call::CallMetadata &m) { tbs_.update(m, registry_); })
{
}

GattSession::~GattSession()
{
    cancel(connect_task_);
    cancel(restart_task_);
    cancel_all_device_tasks();
    if (server_.is_open())
        server_.close();
}

// ---------------- public entry points (any thread) ----------------

bool GattSession::connect(const std::string &addr)
{
    const std::string mac = address::normalize(addr);
    if (!address::is_valid(mac))
    {
        LOG_WARN("[SESSION] invalid address '%s'", addr.c_str());
        return false;
    }
    sched_.post([this, mac]() { do_connect(mac); });
    return true;
}

void GattSession::disconnect()
{
    sched_.post([this]() { do_disconnect(); });
}

void GattSession::on_media_update(const media::MediaMetadata &m)
{
    SessionEvent ev;
    ev.kind  = EventKind::MetadataUpdated;
    ev.media = m;
    post(std::move(ev));
}

void GattSession::on_call_update(const call::CallMetadataUpdate &u)
{
    SessionEvent ev;
    ev.kind = EventKind::MetadataUpdated;
    ev.call = u;
    post(std::move(ev));
}

void GattSession::on_caller_name_hint(const std::string &name)
{
    SessionEvent ev;
    ev.kind      = EventKind::MetadataUpdated;
    ev.name_hint = name;
    post(std::move(ev));
}

void GattSession::request_status()
{
    sched_.post([this]() {
        std::istringstream in(status_report());
        std::string        line;
        while (std::getline(in, line))
            LOG_SYSTEM("[STATUS] %s", line.c_str());
    });
}

void GattSession::post(SessionEvent ev)
{
    const EventKind kind = ev.kind;
    if (sched_.post([this, ev = std::move(ev)]() { dispatch(ev); }) == sched::INVALID_TASK)
        LOG_DEBUG("[SESSION] scheduler stopped, %s dropped", event_kind_name(kind));
}

// ---------------- queue thread ----------------

void GattSession::dispatch(const SessionEvent &ev)
{
    switch (ev.kind)
    {
        case EventKind::DeviceConnected:
            on_device_connected(ev.device);
            break;
        case EventKind::DeviceDisconnected:
            on_device_disconnected(ev.device);
            break;
        case EventKind::ServiceRegistered:
            on_service_registered(ev);
            break;
        case EventKind::CharacteristicWritten:
            on_characteristic_written(ev);
            break;
        case EventKind::SubscriptionChanged:
            registry_.set_subscribed(ev.characteristic, ev.enabled);
            LOG_INFO("[SESSION] notifications %s for %s", ev.enabled ? "enabled" : "disabled",
                     gatt::char_name(ev.characteristic));
            break;
        case EventKind::ClientConnected:
            on_client_connected(ev.device);
            break;
        case EventKind::ClientDisconnected:
            on_client_disconnected(ev.device);
            break;
        case EventKind::MetadataUpdated:
            on_metadata(ev);
            break;
    }
}

void GattSession::set_state(SessionState s)
{
    if (s == state_)
        return;
    LOG_DEBUG("[SESSION] %s -> %s", session_state_name(state_), session_state_name(s));
    state_ = s;
}

void GattSession::cancel(sched::TaskId &id)
{
    if (id != sched::INVALID_TASK)
    {
        sched_.cancel(id);
        id = sched::INVALID_TASK;
    }
}

std::vector<gatt::ServiceDef> GattSession::service_table() const
{
    return {gatt::gap_service_definition(), mcs_.service_definition(), tbs_.service_definition()};
}

gatt::ServerCallbacks GattSession::server_callbacks()
{
    gatt::ServerCallbacks cb;
    cb.on_peer = [this](const std::string &device, bool connected) {
        SessionEvent ev;
        ev.kind   = connected ? EventKind::DeviceConnected : EventKind::DeviceDisconnected;
        ev.device = device;
        post(std::move(ev));
    };
    cb.on_service = [this](std::uint16_t svc, bool ok, const std::vector<gatt::CharId> &chars) {
        SessionEvent ev;
        ev.kind    = EventKind::ServiceRegistered;
        ev.service = svc;
        ev.ok      = ok;
        ev.chars   = chars;
        post(std::move(ev));
    };
    cb.on_write = [this](const std::string &device, gatt::CharId id, const gatt::Bytes &value) {
        SessionEvent ev;
        ev.kind           = EventKind::CharacteristicWritten;
        ev.device         = device;
        ev.characteristic = id;
        ev.value          = value;
        post(std::move(ev));
    };
    cb.on_subscription = [this](gatt::CharId id, bool on) {
        SessionEvent ev;
        ev.kind           = EventKind::SubscriptionChanged;
        ev.characteristic = id;
        ev.enabled        = on;
        post(std::move(ev));
    };
    return cb;
}

gatt::ClientCallbacks GattSession::client_callbacks()
{
    gatt::ClientCallbacks cb;
    cb.on_connection = [this](const std::string &addr, bool connected) {
        SessionEvent ev;
        ev.kind   = connected ? EventKind::ClientConnected : EventKind::ClientDisconnected;
        ev.device = address::normalize(addr);
        post(std::move(ev));
    };
    return cb;
}

// ======================================================================
// Function: GattSession::do_connect
// - In: validated, upper-case address
// - Out: none
// - Note: the server must be up before the client link; the client connect waits
//         connect_delay_ms so service registration settles first
// ======================================================================
void GattSession::do_connect(const std::string &addr)
{
    if (!caps_.has_ble())
    {
        LOG_WARN("[SESSION] connect %s skipped: Bluetooth access not available", addr.c_str());
        return;
    }

    const bool linked = state_ == SessionState::ClientConnecting || state_ == SessionState::Connected;
    if (linked && addr == target_)
    {
        LOG_INFO("[SESSION] already %s to %s", session_state_name(state_), addr.c_str());
        return;
    }
    if (linked)
    {
        LOG_INFO("[SESSION] switching from %s to %s", target_.c_str(), addr.c_str());
        client_.disconnect();
    }

    ++token_;
    target_ = addr;
    cancel(connect_task_);
    if (restart_task_ != sched::INVALID_TASK)
    {
        LOG_INFO("[SESSION] connect during cooldown, restarting server now");
        cancel(restart_task_);
    }

    if (!server_.is_open() && !start_server())
        return;

    const std::uint64_t tok = token_;
    connect_task_ = sched_.post_after(opts_.connect_delay_ms, [this, tok]() {
        if (tok != token_)
        {
            LOG_DEBUG("[SESSION] stale client connect discarded");
            return;
        }
        connect_task_ = sched::INVALID_TASK;
        begin_client_connect();
    });
}

void GattSession::do_disconnect()
{
    if (!caps_.has_ble())
    {
        LOG_WARN("[SESSION] disconnect skipped: Bluetooth access not available");
        return;
    }
    if (state_ == SessionState::Idle)
    {
        LOG_INFO("[SESSION] nothing to disconnect");
        return;
    }
    if (state_ == SessionState::ClientConnecting || state_ == SessionState::Connected)
        client_.disconnect();
    target_.clear();
    teardown("disconnect requested");
}

bool GattSession::start_server()
{
    if (!caps_.has_ble())
    {
        LOG_WARN("[SESSION] server start skipped: Bluetooth access not available");
        return false;
    }

    set_state(SessionState::ServerStarting);
    registered_.clear();
    degraded_.clear();
    ++server_gen_;

    if (!server_.open(service_table(), server_callbacks()))
    {
        LOG_ERROR("[SESSION] GATT server (%s) failed to open", server_.name().c_str());
        set_state(SessionState::Idle);
        return false;
    }
    seed_gap_values();
    mcs_.seed_values();
    tbs_.seed_values();
    LOG_INFO("[SESSION] GATT server (%s) opening", server_.name().c_str());
    return true;
}

void GattSession::seed_gap_values()
{
    bool ok = server_.set_value(gatt::CharId::DeviceName, codec::encode_string(opts_.device_name));
    ok &= server_.set_value(gatt::CharId::Appearance, gatt::Bytes{0x00, 0x00});
    if (!ok)
        LOG_WARN("[SESSION] GAP values could not be stored");
}

void GattSession::begin_client_connect()
{
    if (target_.empty())
        return;
    set_state(SessionState::ClientConnecting);
    LOG_INFO("[SESSION] connecting to %s", target_.c_str());
    if (!client_.connect(target_, client_callbacks()))
    {
        LOG_ERROR("[SESSION] client connect to %s failed to start", target_.c_str());
        set_state(registered_.size() == service_table().size() ? SessionState::ServerReady
                                                               : SessionState::ServerStarting);
    }
}

void GattSession::teardown(const char *why)
{
    LOG_INFO("[SESSION] teardown: %s", why);
    set_state(SessionState::Disconnecting);
    ++token_;
    cancel(connect_task_);
    cancel(restart_task_);
    cancel_all_device_tasks();

    server_.close();
    registry_.clear();
    registered_.clear();
    degraded_.clear();

    set_state(SessionState::CooldownPending);
    const std::uint64_t tok = token_;
    restart_task_ = sched_.post_after(opts_.cooldown_ms, [this, tok]() {
        if (tok != token_)
        {
            LOG_DEBUG("[SESSION] stale server restart discarded");
            return;
        }
        restart_task_ = sched::INVALID_TASK;
        LOG_INFO("[SESSION] cooldown elapsed, restarting GATT server");
        start_server();
    });
}

// ---------------- event handlers ----------------

void GattSession::on_service_registered(const SessionEvent &ev)
{
    if (!server_.is_open())
    {
        LOG_DEBUG("[SESSION] registration of 0x%04x after close ignored", (unsigned)ev.service);
        return;
    }

    const auto table = service_table();
    for (const auto &svc : table)
    {
        if (svc.uuid16 != ev.service)
            continue;
        if (!ev.ok)
        {
            LOG_ERROR("[SESSION] %s (0x%04x) registration failed", svc.name.c_str(),
                      (unsigned)svc.uuid16);
            degraded_.insert(svc.uuid16);
            break;
        }
        for (const auto &c : svc.chars)
        {
            bool found = false;
            for (auto id : ev.chars)
                found = found || id == c.id;
            if (!found)
            {
                LOG_ERROR("[SESSION] %s: characteristic %s missing after registration",
                          svc.name.c_str(), gatt::char_name(c.id));
                degraded_.insert(svc.uuid16);
            }
        }
        LOG_INFO("[SESSION] %s registered%s", svc.name.c_str(),
                 degraded_.count(svc.uuid16) ? " (degraded)" : "");
        break;
    }

    registered_.insert(ev.service);
    if (registered_.size() >= table.size() && state_ == SessionState::ServerStarting)
    {
        set_state(SessionState::ServerReady);
        LOG_INFO("[SESSION] GATT server ready, %zu degraded service(s)", degraded_.size());
    }
}

void GattSession::on_device_connected(const std::string &dev)
{
    if (!server_.is_open())
    {
        LOG_DEBUG("[SESSION] peer %s connected with no server, ignored", dev.c_str());
        return;
    }
    if (!registry_.add(dev))
    {
        LOG_DEBUG("[SESSION] peer %s already known", dev.c_str());
        return;
    }
    registry_.mark_recent(dev);
    LOG_INFO("[SESSION] peer %s connected (%zu total)", dev.c_str(), registry_.connected().size());

    cancel_device_tasks(dev);
    const std::uint64_t gen = server_gen_;
    device_tasks_[dev].burst = sched_.post([this, dev, gen]() {
        if (gen != server_gen_ || !registry_.contains(dev))
            return;
        device_tasks_[dev].burst = sched::INVALID_TASK;
        send_burst(dev);
        schedule_monitor(dev, 1, constants::SUB_MONITOR_FIRST_MS);
    });
}

void GattSession::on_device_disconnected(const std::string &dev)
{
    cancel_device_tasks(dev);
    device_tasks_.erase(dev);
    if (registry_.remove(dev))
        LOG_INFO("[SESSION] peer %s disconnected (%zu left)", dev.c_str(),
                 registry_.connected().size());
}

void GattSession::on_characteristic_written(const SessionEvent &ev)
{
    gatt::ControlResult r;
    switch (ev.characteristic)
    {
        case gatt::CharId::MediaControlPoint:
            r = mcs_.handle_control_point(ev.value);
            break;
        case gatt::CharId::CallControlPoint:
            r = tbs_.handle_control_point(ev.value);
            break;
        default:
            LOG_WARN("[SESSION] write to %s from %s ignored", gatt::char_name(ev.characteristic),
                     ev.device.c_str());
            return;
    }
    LOG_DEBUG("[SESSION] %s [%s] from %s: %s", gatt::char_name(ev.characteristic),
              codec::to_hex(ev.value).c_str(), ev.device.c_str(), gatt::control_result_name(r));
}

void GattSession::on_client_connected(const std::string &addr)
{
    if (addr != target_ || state_ != SessionState::ClientConnecting)
    {
        LOG_DEBUG("[SESSION] late client connect for %s ignored (%s)", addr.c_str(),
                  session_state_name(state_));
        return;
    }
    set_state(SessionState::Connected);
    LOG_INFO("[SESSION] connected to %s", addr.c_str());

    if (!client_.is_bonded(addr))
    {
        LOG_INFO("[SESSION] %s not bonded, pairing", addr.c_str());
        if (!client_.create_bond(addr))
            LOG_WARN("[SESSION] pairing with %s could not start", addr.c_str());
    }
    if (!client_.discover_services())
        LOG_WARN("[SESSION] service discovery on %s could not start", addr.c_str());
}

void GattSession::on_client_disconnected(const std::string &addr)
{
    if (addr != target_ ||
        (state_ != SessionState::ClientConnecting && state_ != SessionState::Connected))
    {
        LOG_DEBUG("[SESSION] client disconnect for %s ignored (%s)", addr.c_str(),
                  session_state_name(state_));
        return;
    }
    teardown("link lost");
}

void GattSession::on_metadata(const SessionEvent &ev)
{
    if (ev.media)
    {
        media::MediaMetadata m = *ev.media;
        m.timestamp_ms         = sched_.now_ms();
        mcs_.update(m, registry_);
    }
    if (ev.call)
        reconciler_.on_telephony(*ev.call);
    if (ev.name_hint)
        reconciler_.on_caller_name_hint(*ev.name_hint);
}

// ---------------- per-device tasks ----------------

void GattSession::send_burst(const std::string &dev)
{
    LOG_INFO("[SESSION] snapshot burst -> %s", dev.c_str());
    registry_.mark_recent(dev);
    mcs_.publish_snapshot(registry_);
    tbs_.publish_snapshot(registry_);
    registry_.clear_recent(dev);
}

void GattSession::schedule_monitor(const std::string &dev, int check, std::uint32_t delay_ms)
{
    const std::uint64_t gen    = server_gen_;
    device_tasks_[dev].monitor = sched_.post_after(delay_ms, [this, dev, gen, check]() {
        if (gen != server_gen_ || !registry_.contains(dev))
            return;
        device_tasks_[dev].monitor = sched::INVALID_TASK;
        check_subscriptions(dev, check);
    });
}

// ======================================================================
// Function: GattSession::check_subscriptions
// - In: peer address, 1-based check number
// - Out: none
// - Note: a peer that connected but never enabled notifications gets the burst again,
//         up to SUB_MONITOR_MAX_CHECKS times
// ======================================================================
void GattSession::check_subscriptions(const std::string &dev, int check)
{
    if (registry_.any_subscription())
    {
        LOG_DEBUG("[SESSION] %s: %zu subscription(s), monitor done", dev.c_str(),
                  registry_.subscriptions().size());
        return;
    }

    LOG_WARN("[SESSION] %s: no subscriptions yet (check %d/%d), re-sending snapshot", dev.c_str(),
             check, constants::SUB_MONITOR_MAX_CHECKS);
    send_burst(dev);

    if (check >= constants::SUB_MONITOR_MAX_CHECKS)
    {
        LOG_WARN("[SESSION] %s never subscribed, monitor stopped", dev.c_str());
        return;
    }
    schedule_monitor(dev, check + 1, constants::SUB_MONITOR_PERIOD_MS);
}

void GattSession::cancel_device_tasks(const std::string &dev)
{
    auto it = device_tasks_.find(dev);
    if (it == device_tasks_.end())
        return;
    cancel(it->second.burst);
    cancel(it->second.monitor);
}

void GattSession::cancel_all_device_tasks()
{
    for (auto &kv : device_tasks_)
    {
        cancel(kv.second.burst);
        cancel(kv.second.monitor);
    }
    device_tasks_.clear();
}

// ---------------- status ----------------

std::string GattSession::status_report() const
{
    std::ostringstream out;
    out << "state=" << session_state_name(state_) << " server="
        << (server_.is_open() ? "open" : "closed") << " (" << server_.name() << ")"
        << " target=" << (target_.empty() ? "(none)" : target_) << "\n";

    out << "services:";
    if (registered_.empty())
        out << " (none)";
    for (auto svc : registered_)
    {
        char buf[16];
        std::snprintf(buf, sizeof(buf), " 0x%04x", (unsigned)svc);
        out << buf << (degraded_.count(svc) ? "(degraded)" : "");
    }
    out << "\n";

    out << "devices:";
    if (registry_.empty())
        out << " (none)";
    for (const auto &d : registry_.connected())
        out << " " << d << (registry_.is_recent(d) ? "(recent)" : "");
    out << "\n";

    out << "subscriptions:";
    if (!registry_.any_subscription())
        out << " (none)";
    for (auto id : registry_.subscriptions())
        out << " " << gatt::char_name(id);
    out << "\n";

    const auto &m = mcs_.current();
    out << "media: ";
    if (m)
        out << "'" << m->title.value_or("") << "' " << (m->is_playing ? "playing" : "paused")
            << " track#" << (unsigned)mcs_.track_counter();
    else
        out << "(none)";
    out << "\n";

    const auto &c = reconciler_.current();
    out << "call: " << call::call_state_name(c.state);
    if (c.call_id)
        out << " id=" << *c.call_id;
    if (c.caller_name)
        out << " name='" << *c.caller_name << "'";
    if (c.phone_number)
        out << " number=" << *c.phone_number;
    out << "\n";
    return out.str();
}

}  // namespace app
