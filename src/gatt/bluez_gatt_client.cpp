// BlueZ GATT client role: Device1 connect, bond and service resolution.

#include <cstring>
#include <mutex>
#include <string>

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

// ======================================================================
// Function: connect
// - In: peripheral address, callbacks (invoked on the bus thread)
// - Out: true if Device1.Connect was sent
// - Note: the outcome arrives via on_connection, from the reply or from
//         the Connected property, whichever comes first
// ======================================================================
bool BluezGatt::connect(const std::string &addr, ClientCallbacks cb)
{
#if PHONELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
    {
        LOG_ERROR("[BLUEZ][client] connect: bus not started");
        return false;
    }

    unref_slot(impl_->connect_call_slot);
    impl_->client_cb        = std::move(cb);
    impl_->client_addr      = address::normalize(addr);
    impl_->client_dev_path  = device_path(addr);
    impl_->client_connected = false;

    int r = sd_bus_call_method_async(impl_->bus, &impl_->connect_call_slot, "org.bluez",
                                     impl_->client_dev_path.c_str(), "org.bluez.Device1", "Connect",
                                     on_connect_reply, this, "");
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][client] Connect %s send failed: %s", impl_->client_addr.c_str(),
                  std::strerror(-r));
        impl_->client_cb = {};
        impl_->client_dev_path.clear();
        return false;
    }
    LOG_INFO("[BLUEZ][client] connecting %s", impl_->client_addr.c_str());
    return true;
#else
    (void)addr;
    (void)cb;
    LOG_ERROR("[BLUEZ][client] built without sd-bus");
    return false;
#endif
}

// Drops the link without reporting it through on_connection
void BluezGatt::disconnect()
{
#if PHONELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    unref_slot(impl_->connect_call_slot);
    unref_slot(impl_->pair_call_slot);
    if (impl_->bus && !impl_->client_dev_path.empty())
    {
        sd_bus_error err = SD_BUS_ERROR_NULL;
        int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->client_dev_path.c_str(),
                                   "org.bluez.Device1", "Disconnect", &err, nullptr, "");
        if (r < 0)
            LOG_WARN("[BLUEZ][client] Disconnect %s: %s", impl_->client_addr.c_str(),
                     err.message ? err.message : std::strerror(-r));
        else
            LOG_INFO("[BLUEZ][client] disconnected %s", impl_->client_addr.c_str());
        sd_bus_error_free(&err);
    }
#endif
    impl_->client_cb = {};
    impl_->client_addr.clear();
    impl_->client_dev_path.clear();
    impl_->client_connected = false;
}

bool BluezGatt::is_bonded(const std::string &addr)
{
#if PHONELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;

    const std::string path   = device_path(addr);
    sd_bus_error      err    = SD_BUS_ERROR_NULL;
    int               paired = 0;
    int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", path.c_str(), "org.bluez.Device1",
                                        "Paired", &err, 'b', &paired);
    if (r < 0)
    {
        LOG_DEBUG("[BLUEZ][client] Paired? %s: %s", addr.c_str(),
                  err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    return paired != 0;
#else
    (void)addr;
    return false;
#endif
}

bool BluezGatt::create_bond(const std::string &addr)
{
#if PHONELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;

    unref_slot(impl_->pair_call_slot);
    const std::string path = device_path(addr);
    int r = sd_bus_call_method_async(impl_->bus, &impl_->pair_call_slot, "org.bluez", path.c_str(),
                                     "org.bluez.Device1", "Pair", on_pair_reply, this, "");
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][client] Pair %s send failed: %s", addr.c_str(), std::strerror(-r));
        return false;
    }
    LOG_INFO("[BLUEZ][client] pairing %s", addr.c_str());
    return true;
#else
    (void)addr;
    return false;
#endif
}

// ======================================================================
// Function: discover_services
// - In: none (current client target)
// - Out: true if the target is known to BlueZ
// - Note: BlueZ resolves services on its own after connect; this reads
//         ServicesResolved and the transition is logged by the signal handler
// ======================================================================
bool BluezGatt::discover_services()
{
#if PHONELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || impl_->client_dev_path.empty())
        return false;

    sd_bus_error err      = SD_BUS_ERROR_NULL;
    int          resolved = 0;
    int r = sd_bus_get_property_trivial(impl_->bus, "org.bluez", impl_->client_dev_path.c_str(),
                                        "org.bluez.Device1", "ServicesResolved", &err, 'b', &resolved);
    if (r < 0)
    {
        LOG_WARN("[BLUEZ][client] ServicesResolved? %s: %s", impl_->client_addr.c_str(),
                 err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
        return false;
    }
    sd_bus_error_free(&err);
    if (resolved)
        LOG_INFO("[BLUEZ][client] services resolved on %s", impl_->client_addr.c_str());
    else
        LOG_INFO("[BLUEZ][client] waiting for service resolution on %s", impl_->client_addr.c_str());
    return true;
#else
    return false;
#endif
}

void BluezGatt::handle_connect_reply(bool ok)
{
    if (impl_->client_dev_path.empty())
        return;  // disconnected meanwhile
    if (impl_->client_connected)
        return;  // Connected property got there first

    impl_->client_connected = ok;
    if (impl_->client_cb.on_connection)
        impl_->client_cb.on_connection(impl_->client_addr, ok);
}

void BluezGatt::handle_services_resolved(const std::string &dev_path, bool resolved)
{
    if (dev_path == impl_->client_dev_path)
        LOG_INFO("[BLUEZ][client] ServicesResolved=%s on %s", resolved ? "true" : "false",
                 impl_->client_addr.c_str());
}

}  // namespace gatt
