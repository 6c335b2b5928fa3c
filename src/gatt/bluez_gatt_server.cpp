// BlueZ GATT server role: exported objects, registration, values, notifications.

#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// clang-format off
#include "gatt/bluez_gatt.hpp"
#include "gatt/bluez_gatt_impl.hpp"
#include "gatt/bluez_dbus_util.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"
// clang-format on

#if PHONELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "gatt/bluez_helper_server.hpp"
#endif

namespace gatt
{

// ======================================================================
// Function: open
// - In: service table, callbacks (invoked on the bus thread)
// - Out: true if the objects are exported and RegisterApplication was sent
// - Note: on_service fires per service once BlueZ answers. A characteristic
//         that fails to export is left out of the reported list.
// ======================================================================
bool BluezGatt::open(const std::vector<ServiceDef> &services, ServerCallbacks cb)
{
#if PHONELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
    {
        LOG_ERROR("[BLUEZ][server] open: bus not started");
        return false;
    }
    if (impl_->server_open)
    {
        LOG_WARN("[BLUEZ][server] open: already open");
        return false;
    }

    int r = sd_bus_add_object_manager(impl_->bus, &impl_->app_slot, impl_->app_path.c_str());
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][server] add_object_manager failed: %s", std::strerror(-r));
        return false;
    }

    for (size_t si = 0; si < services.size(); ++si)
    {
        const ServiceDef &def = services[si];
        auto              svc = std::make_unique<BluezService>();
        svc->uuid16           = def.uuid16;
        svc->name             = def.name;
        svc->uuid             = constants::uuid16_to_string(def.uuid16);
        svc->path             = impl_->app_path + "/service" + std::to_string(si);

        r = sd_bus_add_object_vtable(impl_->bus, &svc->slot, svc->path.c_str(),
                                     "org.bluez.GattService1", k_service_vtbl, svc.get());
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ][server] export %s failed: %s", def.name.c_str(), std::strerror(-r));
            impl_->services.push_back(std::move(svc));
            release_objects();
            return false;
        }

        for (size_t ci = 0; ci < def.chars.size(); ++ci)
        {
            const CharDef &cd  = def.chars[ci];
            auto           chr = std::make_unique<BluezChar>();
            chr->owner         = this;
            chr->id            = cd.id;
            chr->flags         = cd.flags;
            chr->uuid          = constants::uuid16_to_string(cd.uuid16);
            chr->path          = svc->path + "/char" + std::to_string(ci);
            chr->svc_path      = svc->path;

            r = sd_bus_add_object_vtable(impl_->bus, &chr->slot, chr->path.c_str(),
                                         "org.bluez.GattCharacteristic1", k_char_vtbl, chr.get());
            if (r < 0)
            {
                LOG_ERROR("[BLUEZ][server] export %s/%s failed: %s", def.name.c_str(),
                          char_name(cd.id), std::strerror(-r));
                continue;
            }
            svc->chars.push_back(cd.id);
            impl_->by_id[cd.id] = chr.get();
            impl_->chars.push_back(std::move(chr));
        }
        LOG_DEBUG("[BLUEZ][server] exported %s at %s (%zu chars)", def.name.c_str(),
                  svc->path.c_str(), svc->chars.size());
        impl_->services.push_back(std::move(svc));
    }

    impl_->server_cb = std::move(cb);

    r = sd_bus_call_method_async(impl_->bus, &impl_->reg_slot, "org.bluez",
                                 impl_->adapter_path.c_str(), "org.bluez.GattManager1",
                                 "RegisterApplication", on_register_app_reply, this, "oa{sv}",
                                 impl_->app_path.c_str(), 0);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ][server] RegisterApplication send failed: %s", std::strerror(-r));
        release_objects();
        impl_->server_cb = {};
        return false;
    }

    r = sd_bus_add_object_vtable(impl_->bus, &impl_->adv_obj_slot, impl_->adv_path.c_str(),
                                 "org.bluez.LEAdvertisement1", k_adv_vtbl, this);
    if (r >= 0)
    {
        r = sd_bus_call_method_async(impl_->bus, &impl_->adv_call_slot, "org.bluez",
                                     impl_->adapter_path.c_str(), "org.bluez.LEAdvertisingManager1",
                                     "RegisterAdvertisement", on_register_adv_reply, this, "oa{sv}",
                                     impl_->adv_path.c_str(), 0);
    }
    if (r < 0)
        LOG_WARN("[BLUEZ][server] advertisement not registered: %s", std::strerror(-r));

    impl_->server_open = true;
    impl_->registered  = false;
    LOG_INFO("[BLUEZ][server] application %s submitted (%zu services)", impl_->app_path.c_str(),
             impl_->services.size());
    return true;
#else
    (void)services;
    (void)cb;
    LOG_ERROR("[BLUEZ][server] built without sd-bus");
    return false;
#endif
}

// ======================================================================
// Function: close
// - In: none
// - Out: advertisement and application unregistered, objects unexported
// - Note: no callbacks fire after close returns
// ======================================================================
void BluezGatt::close()
{
#if PHONELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->server_open)
        return;

    if (impl_->bus)
    {
        sd_bus_error err = SD_BUS_ERROR_NULL;
        int r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                   "org.bluez.LEAdvertisingManager1", "UnregisterAdvertisement",
                                   &err, nullptr, "o", impl_->adv_path.c_str());
        if (r < 0)
            LOG_DEBUG("[BLUEZ][server] UnregisterAdvertisement: %s",
                      err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);

        err = SD_BUS_ERROR_NULL;
        r   = sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                 "org.bluez.GattManager1", "UnregisterApplication", &err, nullptr,
                                 "o", impl_->app_path.c_str());
        if (r < 0)
            LOG_DEBUG("[BLUEZ][server] UnregisterApplication: %s",
                      err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
    }

    release_objects();
    impl_->server_cb   = {};
    impl_->server_open = false;
    impl_->registered  = false;
    impl_->peers.clear();
    LOG_INFO("[BLUEZ][server] closed");
#endif
}

bool BluezGatt::is_open() const
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    return impl_->server_open;
}

// bus_mu held
void BluezGatt::release_objects()
{
#if PHONELINK_HAVE_SDBUS
    unref_slot(impl_->adv_call_slot);
    unref_slot(impl_->adv_obj_slot);
    unref_slot(impl_->reg_slot);
    for (auto &chr : impl_->chars)
        unref_slot(chr->slot);
    for (auto &svc : impl_->services)
        unref_slot(svc->slot);
    unref_slot(impl_->app_slot);
#endif
    impl_->by_id.clear();
    impl_->chars.clear();
    impl_->services.clear();
}

bool BluezGatt::set_value(CharId id, const Bytes &value)
{
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->server_open)
        return false;
    auto it = impl_->by_id.find(id);
    if (it == impl_->by_id.end())
        return false;
    it->second->value = value;
    return true;
}

// ======================================================================
// Function: notify
// - In: target device, characteristic, payload
// - Out: true if PropertiesChanged(Value) was sent
// - Note: BlueZ delivers to every subscribed client; the device is for logs
// ======================================================================
bool BluezGatt::notify(const std::string &device, CharId id, const Bytes &value)
{
#if PHONELINK_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->server_open || !impl_->bus)
        return false;
    auto it = impl_->by_id.find(id);
    if (it == impl_->by_id.end())
        return false;

    BluezChar &chr = *it->second;
    chr.value      = value;
    if (!chr.notifying)
    {
        LOG_DEBUG("[BLUEZ][server] %s not subscribed, %s skipped", char_name(id), device.c_str());
        return false;
    }
    if (!emit_value_changed(impl_->bus, chr.path, value))
    {
        LOG_WARN("[BLUEZ][server] notify %s failed", char_name(id));
        return false;
    }
    LOG_DEBUG("[BLUEZ][server] notify %s (%zu bytes) for %s", char_name(id), value.size(),
              device.c_str());
    return true;
#else
    (void)device;
    (void)id;
    (void)value;
    return false;
#endif
}

// bus_mu held (advertisement property getter)
std::vector<std::string> BluezGatt::advertised_uuids() const
{
    std::vector<std::string> out;
    for (const auto &svc : impl_->services)
    {
        if (svc->uuid16 != constants::GAP_SVC)
            out.push_back(svc->uuid);
    }
    return out;
}

void BluezGatt::handle_app_registered(bool ok)
{
    impl_->registered = ok;
    if (ok)
        LOG_INFO("[BLUEZ][server] application registered");

    for (const auto &svc : impl_->services)
    {
        if (impl_->server_cb.on_service)
            impl_->server_cb.on_service(svc->uuid16, ok, ok ? svc->chars : std::vector<CharId>{});
    }
}

void BluezGatt::handle_write(BluezChar &chr, const std::string &dev_path, const Bytes &value)
{
    std::string addr = address_from_path(dev_path);
    if (addr.empty() && impl_->peers.size() == 1)
        addr = address_from_path(*impl_->peers.begin());

    LOG_DEBUG("[BLUEZ][server] WriteValue %s (%zu bytes) from %s", char_name(chr.id), value.size(),
              addr.empty() ? "?" : addr.c_str());
    if (impl_->server_cb.on_write)
        impl_->server_cb.on_write(addr, chr.id, value);
}

void BluezGatt::handle_notify_state(BluezChar &chr, bool on)
{
    chr.notifying = on;
#if PHONELINK_HAVE_SDBUS
    if (impl_->bus)
    {
        int r = sd_bus_emit_properties_changed(impl_->bus, chr.path.c_str(),
                                               "org.bluez.GattCharacteristic1", "Notifying", nullptr);
        if (r < 0)
            LOG_DEBUG("[BLUEZ][server] emit Notifying failed: %s", std::strerror(-r));
    }
#endif
    LOG_INFO("[BLUEZ][server] %s notifications %s", char_name(chr.id), on ? "on" : "off");
    if (impl_->server_cb.on_subscription)
        impl_->server_cb.on_subscription(chr.id, on);
}

}  // namespace gatt
