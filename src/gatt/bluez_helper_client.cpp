#include "gatt/bluez_helper_client.hpp"

#if PHONELINK_HAVE_SDBUS
#include <cstring>
#include <string>

#include "gatt/bluez_dbus_util.hpp"
#include "gatt/bluez_gatt.hpp"
#include "util/log.hpp"

namespace gatt
{

// ======================================================================
// Function: on_props_changed
// - In: PropertiesChanged (sa{sv}as) from org.bluez
// - Out: Device1.Connected / ServicesResolved forwarded to the owner
// - Note: other interfaces and keys are skipped
// ======================================================================
int on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto       *self = static_cast<BluezGatt *>(userdata);
    const char *path = sd_bus_message_get_path(m);
    if (!path || !is_device_path(path, self->adapter_path()))
        return 0;

    const char *iface = nullptr;
    int         r     = sd_bus_message_read(m, "s", &iface);
    if (r < 0 || !iface || std::strcmp(iface, "org.bluez.Device1") != 0)
        return 0;

    r = sd_bus_message_enter_container(m, 'a', "{sv}");
    if (r < 0)
        return 0;

    bool have_conn = false, connected = false;
    bool have_res = false, resolved = false;
    while ((r = sd_bus_message_enter_container(m, 'e', "sv")) > 0)
    {
        const char *key = nullptr;
        if (sd_bus_message_read(m, "s", &key) < 0)
            break;
        if (key && std::strcmp(key, "Connected") == 0)
        {
            if (read_var_b(m, connected) >= 0)
                have_conn = true;
        }
        else if (key && std::strcmp(key, "ServicesResolved") == 0)
        {
            if (read_var_b(m, resolved) >= 0)
                have_res = true;
        }
        else
        {
            sd_bus_message_skip(m, "v");
        }
        sd_bus_message_exit_container(m);  // e
    }
    sd_bus_message_exit_container(m);  // a

    if (have_conn)
        self->handle_device_connected(path, connected);
    if (have_res)
        self->handle_services_resolved(path, resolved);
    return 0;
}

// InterfacesRemoved (oas): a vanished Device1 counts as disconnected
int on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto       *self = static_cast<BluezGatt *>(userdata);
    const char *path = nullptr;
    if (sd_bus_message_read(m, "o", &path) < 0 || !path)
        return 0;
    if (!is_device_path(path, self->adapter_path()))
        return 0;

    if (sd_bus_message_enter_container(m, 'a', "s") < 0)
        return 0;
    const char *iface = nullptr;
    bool        dev   = false;
    while (sd_bus_message_read(m, "s", &iface) > 0)
    {
        if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
            dev = true;
    }
    sd_bus_message_exit_container(m);

    if (dev)
        self->handle_device_removed(path);
    return 0;
}

int on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto *self = static_cast<BluezGatt *>(userdata);
    if (sd_bus_message_is_method_error(m, "org.bluez.Error.AlreadyConnected"))
    {
        self->handle_connect_reply(true);
        return 0;
    }
    if (sd_bus_message_is_method_error(m, "org.bluez.Error.InProgress"))
    {
        LOG_DEBUG("[BLUEZ][client] Connect already in progress, waiting for Connected");
        return 0;
    }
    bool ok = !log_if_method_error(m, "[BLUEZ][client]", "Device1.Connect");
    self->handle_connect_reply(ok);
    return 0;
}

int on_pair_reply(sd_bus_message *m, void *, sd_bus_error *)
{
    // bonding outcome only affects encryption; the link stays up either way
    if (!log_if_method_error(m, "[BLUEZ][client]", "Device1.Pair"))
        LOG_INFO("[BLUEZ][client] paired");
    return 0;
}

}  // namespace gatt
#endif
