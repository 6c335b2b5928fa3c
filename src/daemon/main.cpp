#include <cstdlib>
#include <memory>
#include <string>

#include "app/capabilities.hpp"
#include "app/config.hpp"
#include "app/gatt_session.hpp"
#include "app/hooks.hpp"
#include "ctl/commands.hpp"
#include "ctl/ipc.hpp"
#include "gatt/bluez_gatt.hpp"
#include "gatt/loopback_gatt.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "util/scheduler.hpp"

namespace
{

app::GattSession *g_session = nullptr;

// GATT server + client pair, either in-process or BlueZ
struct Backend
{
    std::unique_ptr<gatt::LoopbackGattServer> lo_server;
    std::unique_ptr<gatt::LoopbackGattClient> lo_client;
    std::unique_ptr<gatt::BluezGatt>          bluez;
    std::unique_ptr<app::ICapabilities>       caps;

    gatt::IGattServer *server = nullptr;
    gatt::IGattClient *client = nullptr;

    void stop()
    {
        if (bluez)
            bluez->stop();
    }
};

bool make_backend(const app::Config &cfg, Backend &out)
{
    if (cfg.transport == app::TransportKind::Bluez)
    {
        gatt::BluezConfig bc;
        bc.adapter    = cfg.adapter;
        bc.local_name = cfg.device_name;
        out.bluez     = std::make_unique<gatt::BluezGatt>(std::move(bc));
        if (!out.bluez->start())
            return false;
        out.server = out.bluez.get();
        out.client = out.bluez.get();
        out.caps   = std::make_unique<app::AdapterCapabilities>(cfg.adapter);
        return true;
    }
    out.lo_server = std::make_unique<gatt::LoopbackGattServer>();
    out.lo_client = std::make_unique<gatt::LoopbackGattClient>();
    out.server    = out.lo_server.get();
    out.client    = out.lo_client.get();
    out.caps      = std::make_unique<app::FixedCapabilities>(true);
    return true;
}

// One control line. false stops the IPC server (QUIT).
bool on_line(const std::string &line)
{
    std::string err;
    auto        cmd = ctl::parse_command(line, &err);
    if (!cmd)
    {
        LOG_WARN("[IPC] rejected '%s': %s", line.c_str(), err.c_str());
        return true;
    }

    switch (cmd->kind)
    {
        case ctl::CommandKind::Connect:
            if (g_session->connect(cmd->address))
                LOG_SYSTEM("[CONNECT] target %s", cmd->address.c_str());
            else
                LOG_WARN("[CONNECT] invalid address: %s", cmd->address.c_str());
            return true;
        case ctl::CommandKind::Disconnect:
            g_session->disconnect();
            LOG_SYSTEM("[DISCONNECT] link dropped and target cleared");
            return true;
        case ctl::CommandKind::Status:
            g_session->request_status();
            return true;
        case ctl::CommandKind::Quit:
            LOG_INFO("Received QUIT command, exiting...");
            return false;
        case ctl::CommandKind::Media:
            g_session->on_media_update(cmd->media);
            return true;
        case ctl::CommandKind::Call:
            g_session->on_call_update(cmd->call);
            return true;
        case ctl::CommandKind::Name:
            g_session->on_caller_name_hint(cmd->name);
            return true;
    }
    return true;
}

}  // namespace

int main()
{
    // log level first so config parsing is visible
    if (const char *log_level = std::getenv("PHONELINK_LOG_LEVEL"))
        phonelink::set_log_level_by_name(log_level);

    app::Config cfg = app::load_config_from_env();
    LOG_SYSTEM("Config: transport=%s adapter=%s peer=%s name=%s delay=%ums cooldown=%ums",
               app::transport_name(cfg.transport), cfg.adapter.c_str(),
               cfg.peer.empty() ? "(none)" : cfg.peer.c_str(), cfg.device_name.c_str(),
               (unsigned)cfg.connect_delay_ms, (unsigned)cfg.cooldown_ms);

    sched::ThreadScheduler scheduler;
    if (!scheduler.start())
    {
        LOG_ERROR("scheduler start failed");
        return exitc::failure;
    }

    Backend backend;
    if (!make_backend(cfg, backend))
    {
        LOG_ERROR("%s backend start failed", app::transport_name(cfg.transport));
        scheduler.stop();
        return exitc::failure;
    }

    app::HookMediaSource media_hook(cfg.media_hook);
    app::HookTelephony   call_hook(cfg.call_hook);
    if (cfg.media_hook.empty())
        LOG_WARN("PHONELINK_MEDIA_HOOK not set; media commands will be reported as failed");
    if (cfg.call_hook.empty())
        LOG_WARN("PHONELINK_CALL_HOOK not set; call commands are unsupported");

    app::SessionOptions opts;
    opts.connect_delay_ms = cfg.connect_delay_ms;
    opts.cooldown_ms      = cfg.cooldown_ms;
    opts.device_name      = cfg.device_name;

    int rc = exitc::ok;
    {
        app::GattSession session(*backend.server, *backend.client, scheduler, media_hook, call_hook,
                                 *backend.caps, opts);
        g_session = &session;

        if (!cfg.peer.empty() && !session.connect(cfg.peer))
            LOG_WARN("Ignoring invalid PHONELINK_PEER='%s'", cfg.peer.c_str());

        if (!ipc::start_server(cfg.ctl_sock, &on_line))
        {
            LOG_ERROR("start_server failed");
            rc = exitc::failure;
        }

        // bus thread first so no callback can post, then drain the queue
        backend.stop();
        scheduler.stop();
        g_session = nullptr;
    }
    LOG_SYSTEM("phonelinkd exiting");
    return rc;
}
