/* ======================================================================
 * BlueZ GATT backend (facade): overall flow
 *
 *  Queue thread                          BluezGatt                         bus loop thread
 *  ------------                          ---------                         ---------------
 *  start()
 *    └─ sd_bus_open_system
 *    └─ match PropertiesChanged / InterfacesRemoved from org.bluez
 *    └─ spawn loop ───────────────────────────────────────────────────▶  process (bus_mu) / wait
 *
 *  open(services, cb)          (bluez_gatt_server.cpp)
 *    └─ export ObjectManager + GattService1 + GattCharacteristic1 objects
 *    └─ RegisterApplication (async) ──────────────────────────────────▶  reply: on_service per service
 *    └─ export LEAdvertisement1, RegisterAdvertisement (async)
 *
 *  connect(addr, cb)           (bluez_gatt_client.cpp)
 *    └─ Device1.Connect (async) ──────────────────────────────────────▶  reply / Connected=true: on_connection
 *
 *  Signals                                                               Device1.Connected on dev_*:
 *                                                                          on_peer (server open)
 *                                                                          on_connection (client target)
 *  stop()
 *    └─ close() server, Device1.Disconnect best effort
 *    └─ sd_bus_close under bus_mu, join loop, flush+unref
 *
 *  Notes
 *    └─ Every sd-bus call from the queue thread holds impl_->bus_mu
 *    └─ handle_* run on the bus thread with bus_mu held; callbacks only post
 * ====================================================================== */

#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

// clang-format off
#include "gatt/bluez_gatt.hpp"
#include "gatt/bluez_gatt_impl.hpp"
#include "gatt/bluez_dbus_util.hpp"
#include "util/address.hpp"
#include "util/log.hpp"
// clang-format on

#if PHONELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "gatt/bluez_helper_client.hpp"
#endif

namespace gatt
{

bool bluez_adapter_present(const std::string &adapter)
{
#if PHONELINK_HAVE_SDBUS
    sd_bus *bus = nullptr;
    int     r   = sd_bus_open_system(&bus);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] system bus unavailable: %s", std::strerror(-r));
        return false;
    }

    const std::string path    = "/org/bluez/" + adapter;
    sd_bus_error      err     = SD_BUS_ERROR_NULL;
    int               powered = 0;
    r = sd_bus_get_property_trivial(bus, "org.bluez", path.c_str(), "org.bluez.Adapter1", "Powered",
                                    &err, 'b', &powered);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ] adapter %s not available: %s", adapter.c_str(),
                 err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
        sd_bus_flush_close_unref(bus);
        return false;
    }
    sd_bus_error_free(&err);
    if (!powered)
        LOG_WARN("[BLUEZ] adapter %s is powered off", adapter.c_str());

    sd_bus_flush_close_unref(bus);
    return true;
#else
    LOG_ERROR("[BLUEZ] built without sd-bus; cannot probe adapter %s", adapter.c_str());
    return false;
#endif
}

BluezGatt::BluezGatt(BluezConfig cfg) : cfg_(std::move(cfg)), impl_(std::make_unique<Impl>())
{
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
}

BluezGatt::~BluezGatt()
{
    stop();
}

// ======================================================================
// Function: start
// - In: none (adapter from config)
// - Out: true if the system bus is open and the loop thread runs
// ======================================================================
bool BluezGatt::start()
{
#if PHONELINK_HAVE_SDBUS
    if (running_.load())
        return true;

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        int                         r = sd_bus_open_system(&impl_->bus);
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ] sd_bus_open_system failed: %s", std::strerror(-r));
            impl_->bus = nullptr;
            return false;
        }

        const char *uniq = nullptr;
        if (sd_bus_get_unique_name(impl_->bus, &uniq) >= 0 && uniq)
            impl_->unique_name = uniq;

        // device objects live under the adapter; filter by path in the handler
        r = sd_bus_match_signal(impl_->bus, &impl_->props_slot, "org.bluez", nullptr,
                                "org.freedesktop.DBus.Properties", "PropertiesChanged",
                                on_props_changed, this);
        if (r < 0)
            LOG_WARN("[BLUEZ] match PropertiesChanged failed: %s", std::strerror(-r));

        r = sd_bus_match_signal(impl_->bus, &impl_->removed_slot, "org.bluez", "/",
                                "org.freedesktop.DBus.ObjectManager", "InterfacesRemoved",
                                on_iface_removed, this);
        if (r < 0)
            LOG_WARN("[BLUEZ] match InterfacesRemoved failed: %s", std::strerror(-r));
    }

    running_ = true;
    impl_->loop = std::thread(
        [this]
        {
            while (running_.load())
            {
                int r;
                {
                    std::lock_guard<std::mutex> lk(impl_->bus_mu);
                    r = sd_bus_process(impl_->bus, nullptr);
                }
                if (r < 0)
                {
                    if (running_.load())
                        LOG_ERROR("[BLUEZ] sd_bus_process: %s", std::strerror(-r));
                    break;
                }
                if (r > 0)
                    continue;  // more to process

                // wait outside the lock so the queue thread can issue calls
                r = sd_bus_wait(impl_->bus, 100 * 1000);
                if (r < 0 && r != -EINTR)
                {
                    if (running_.load())
                        LOG_ERROR("[BLUEZ] sd_bus_wait: %s", std::strerror(-r));
                    break;
                }
            }
        });

    LOG_INFO("[BLUEZ] started on %s as %s", impl_->adapter_path.c_str(),
             impl_->unique_name.empty() ? "?" : impl_->unique_name.c_str());
    return true;
#else
    LOG_ERROR("[BLUEZ] built without sd-bus; BlueZ backend unavailable");
    return false;
#endif
}

// ======================================================================
// Function: stop
// - In: none
// - Out: server closed, client link dropped, bus closed and loop joined
// - Note: idempotent
// ======================================================================
void BluezGatt::stop()
{
#if PHONELINK_HAVE_SDBUS
    if (!running_.exchange(false))
        return;

    close();

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        unref_slot(impl_->connect_call_slot);
        unref_slot(impl_->pair_call_slot);
        if (impl_->bus && !impl_->client_dev_path.empty())
        {
            sd_bus_error err = SD_BUS_ERROR_NULL;
            int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->client_dev_path.c_str(),
                                       "org.bluez.Device1", "Disconnect", &err, nullptr, "");
            if (r < 0)
                LOG_DEBUG("[BLUEZ][client] Disconnect on stop: %s",
                          err.message ? err.message : std::strerror(-r));
            sd_bus_error_free(&err);
        }
        if (impl_->bus)
            sd_bus_close(impl_->bus);  // wakes sd_bus_wait
    }

    if (impl_->loop.joinable())
        impl_->loop.join();

    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        unref_slot(impl_->props_slot);
        unref_slot(impl_->removed_slot);
        if (impl_->bus)
        {
            sd_bus_flush_close_unref(impl_->bus);
            impl_->bus = nullptr;
        }
        impl_->client_cb        = {};
        impl_->client_addr.clear();
        impl_->client_dev_path.clear();
        impl_->client_connected = false;
    }
    LOG_INFO("[BLUEZ] stopped");
#endif
}

const std::string &BluezGatt::adapter_path() const
{
    return impl_->adapter_path;
}

const std::string &BluezGatt::app_path() const
{
    return impl_->app_path;
}

const std::string &BluezGatt::unique_name() const
{
    return impl_->unique_name;
}

std::string BluezGatt::device_path(const std::string &addr) const
{
    return impl_->adapter_path + "/dev_" + address::to_path_fragment(addr);
}

// ======================================================================
// Function: handle_device_connected
// - In: device object path, new Connected value (bus thread, bus_mu held)
// - Out: on_peer while the server is open; on_connection for the client target
// - Note: only transitions are reported
// ======================================================================
void BluezGatt::handle_device_connected(const std::string &dev_path, bool connected)
{
    const std::string addr = address_from_path(dev_path);
    if (addr.empty())
        return;

    if (impl_->server_open)
    {
        const bool known = impl_->peers.count(dev_path) > 0;
        if (connected && !known)
        {
            impl_->peers.insert(dev_path);
            LOG_INFO("[BLUEZ][server] peer connected %s", addr.c_str());
            if (impl_->server_cb.on_peer)
                impl_->server_cb.on_peer(addr, true);
        }
        else if (!connected && known)
        {
            impl_->peers.erase(dev_path);
            LOG_INFO("[BLUEZ][server] peer disconnected %s", addr.c_str());
            if (impl_->server_cb.on_peer)
                impl_->server_cb.on_peer(addr, false);
        }
    }

    if (dev_path == impl_->client_dev_path && connected != impl_->client_connected)
    {
        impl_->client_connected = connected;
        LOG_INFO("[BLUEZ][client] link %s %s", addr.c_str(), connected ? "up" : "down");
        if (impl_->client_cb.on_connection)
            impl_->client_cb.on_connection(addr, connected);
    }
}

void BluezGatt::handle_device_removed(const std::string &dev_path)
{
    LOG_DEBUG("[BLUEZ] device object removed %s", dev_path.c_str());
    handle_device_connected(dev_path, false);
}

}  // namespace gatt
