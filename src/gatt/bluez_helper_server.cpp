#include "gatt/bluez_helper_server.hpp"

#if PHONELINK_HAVE_SDBUS
#include <cstring>
#include <string>
#include <vector>

#include "gatt/bluez_dbus_util.hpp"
#include "gatt/bluez_gatt_impl.hpp"
#include "util/log.hpp"

namespace gatt
{

// ---------- GattService1 properties ----------

static int svc_prop_UUID(sd_bus *, const char *, const char *, const char *,
                         sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    auto *svc = static_cast<BluezService *>(userdata);
    return sd_bus_message_append(reply, "s", svc->uuid.c_str());
}

static int svc_prop_Primary(sd_bus *, const char *, const char *, const char *,
                            sd_bus_message *reply, void *, sd_bus_error *)
{
    int yes = 1;
    return sd_bus_message_append_basic(reply, 'b', &yes);
}

static int svc_prop_Includes(sd_bus *, const char *, const char *, const char *,
                             sd_bus_message *reply, void *, sd_bus_error *)
{
    // no included services
    int r = sd_bus_message_open_container(reply, 'a', "o");
    if (r < 0)
        return r;
    return sd_bus_message_close_container(reply);
}

// ---------- GattCharacteristic1 properties ----------

static int chr_prop_UUID(sd_bus *, const char *, const char *, const char *,
                         sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    auto *chr = static_cast<BluezChar *>(userdata);
    return sd_bus_message_append(reply, "s", chr->uuid.c_str());
}

static int chr_prop_Service(sd_bus *, const char *, const char *, const char *,
                            sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    auto *chr = static_cast<BluezChar *>(userdata);
    return sd_bus_message_append(reply, "o", chr->svc_path.c_str());
}

static int chr_prop_Flags(sd_bus *, const char *, const char *, const char *,
                          sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    auto *chr = static_cast<BluezChar *>(userdata);
    return append_string_array(reply, flag_names(chr->flags));
}

static int chr_prop_Notifying(sd_bus *, const char *, const char *, const char *,
                              sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    auto *chr = static_cast<BluezChar *>(userdata);
    int   b   = chr->notifying ? 1 : 0;
    return sd_bus_message_append_basic(reply, 'b', &b);
}

static int chr_prop_Value(sd_bus *, const char *, const char *, const char *,
                          sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    auto *chr = static_cast<BluezChar *>(userdata);
    return sd_bus_message_append_array(reply, 'y', chr->value.data(), chr->value.size());
}

// ======================================================================
// Function: read_options
// - In: m positioned at the a{sv} options argument
// - Out: offset and device (object path) if present, others skipped
// ======================================================================
static int read_options(sd_bus_message *m, uint16_t &offset, std::string &device)
{
    int r = sd_bus_message_enter_container(m, 'a', "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, 'e', "sv")) > 0)
    {
        const char *key = nullptr;
        r               = sd_bus_message_read(m, "s", &key);
        if (r < 0)
            return r;
        if (key && std::strcmp(key, "offset") == 0)
            r = read_var_q(m, offset);
        else if (key && std::strcmp(key, "device") == 0)
            r = read_var_o(m, device);
        else
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;
        r = sd_bus_message_exit_container(m);  // e
        if (r < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);  // a
}

// ---------- GattCharacteristic1 methods ----------

// ReadValue(a{sv}) -> ay, honours "offset"
static int chr_ReadValue(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto       *chr    = static_cast<BluezChar *>(userdata);
    uint16_t    offset = 0;
    std::string device;
    int         r = read_options(m, offset, device);
    if (r < 0)
        return r;

    if (!(chr->flags & FLAG_READ))
        return sd_bus_reply_method_errorf(m, "org.bluez.Error.NotPermitted", "Read not permitted");
    if (offset > chr->value.size())
        return sd_bus_reply_method_errorf(m, "org.bluez.Error.InvalidOffset", "Invalid offset");

    LOG_DEBUG("[BLUEZ][server] ReadValue %s offset=%u from %s", char_name(chr->id),
              (unsigned)offset, device.empty() ? "?" : address_from_path(device).c_str());

    sd_bus_message *reply = nullptr;
    r                     = sd_bus_message_new_method_return(m, &reply);
    if (r < 0)
        return r;
    r = sd_bus_message_append_array(reply, 'y', chr->value.data() + offset,
                                    chr->value.size() - offset);
    if (r >= 0)
        r = sd_bus_send(nullptr, reply, nullptr);
    sd_bus_message_unref(reply);
    return r;
}

// WriteValue(aya{sv}); only offset 0 is supported
static int chr_WriteValue(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto *chr = static_cast<BluezChar *>(userdata);

    const void *data = nullptr;
    size_t      len  = 0;
    int         r    = sd_bus_message_read_array(m, 'y', &data, &len);
    if (r < 0)
        return r;

    uint16_t    offset = 0;
    std::string device;
    r = read_options(m, offset, device);
    if (r < 0)
        return r;

    if (!(chr->flags & (FLAG_WRITE | FLAG_WRITE_NO_RSP)))
        return sd_bus_reply_method_errorf(m, "org.bluez.Error.NotPermitted", "Write not permitted");
    if (offset != 0)
        return sd_bus_reply_method_errorf(m, "org.bluez.Error.InvalidOffset", "Invalid offset");

    const auto *p = static_cast<const uint8_t *>(data);
    chr->owner->handle_write(*chr, device, Bytes(p, p + len));
    return sd_bus_reply_method_return(m, "");
}

static int chr_StartNotify(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto *chr = static_cast<BluezChar *>(userdata);
    if (!(chr->flags & FLAG_NOTIFY))
        return sd_bus_reply_method_errorf(m, "org.bluez.Error.NotSupported", "Notify not supported");
    if (!chr->notifying)
        chr->owner->handle_notify_state(*chr, true);
    return sd_bus_reply_method_return(m, "");
}

static int chr_StopNotify(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto *chr = static_cast<BluezChar *>(userdata);
    if (chr->notifying)
        chr->owner->handle_notify_state(*chr, false);
    return sd_bus_reply_method_return(m, "");
}

// ---------- LEAdvertisement1 ----------

static int adv_prop_Type(sd_bus *, const char *, const char *, const char *,
                         sd_bus_message *reply, void *, sd_bus_error *)
{
    return sd_bus_message_append(reply, "s", "peripheral");
}

static int adv_prop_ServiceUUIDs(sd_bus *, const char *, const char *, const char *,
                                 sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    auto *self = static_cast<BluezGatt *>(userdata);
    return append_string_array(reply, self->advertised_uuids());
}

static int adv_prop_LocalName(sd_bus *, const char *, const char *, const char *,
                              sd_bus_message *reply, void *userdata, sd_bus_error *)
{
    auto *self = static_cast<BluezGatt *>(userdata);
    return sd_bus_message_append(reply, "s", self->config().local_name.c_str());
}

static int adv_prop_IncludeTxPower(sd_bus *, const char *, const char *, const char *,
                                   sd_bus_message *reply, void *, sd_bus_error *)
{
    int b = 0;
    return sd_bus_message_append_basic(reply, 'b', &b);
}

static int adv_Release(sd_bus_message *m, void *, sd_bus_error *)
{
    LOG_INFO("[BLUEZ][server] advertisement released by BlueZ");
    return sd_bus_reply_method_return(m, "");
}

// clang-format off
const sd_bus_vtable k_service_vtbl[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("UUID",     "s",  svc_prop_UUID,     0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Primary",  "b",  svc_prop_Primary,  0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Includes", "ao", svc_prop_Includes, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_VTABLE_END
};

const sd_bus_vtable k_char_vtbl[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("UUID",      "s",  chr_prop_UUID,      0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Service",   "o",  chr_prop_Service,   0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Flags",     "as", chr_prop_Flags,     0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Notifying", "b",  chr_prop_Notifying, 0, SD_BUS_VTABLE_PROPERTY_EMITS_CHANGE),
    SD_BUS_PROPERTY("Value",     "ay", chr_prop_Value,     0, SD_BUS_VTABLE_PROPERTY_EMITS_CHANGE),
    SD_BUS_METHOD("ReadValue",   "a{sv}",   "ay", chr_ReadValue,   SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("WriteValue",  "aya{sv}", "",   chr_WriteValue,  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("StartNotify", "",        "",   chr_StartNotify, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_METHOD("StopNotify",  "",        "",   chr_StopNotify,  SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END
};

const sd_bus_vtable k_adv_vtbl[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("Type",           "s",  adv_prop_Type,           0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("ServiceUUIDs",   "as", adv_prop_ServiceUUIDs,   0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("LocalName",      "s",  adv_prop_LocalName,      0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("IncludeTxPower", "b",  adv_prop_IncludeTxPower, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_METHOD("Release", "", "", adv_Release, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END
};
// clang-format on

// ---------- async replies ----------

int on_register_app_reply(sd_bus_message *m, void *userdata, sd_bus_error *)
{
    auto *self = static_cast<BluezGatt *>(userdata);
    bool  ok   = !log_if_method_error(m, "[BLUEZ][server]", "RegisterApplication");
    self->handle_app_registered(ok);
    return 0;
}

int on_register_adv_reply(sd_bus_message *m, void *, sd_bus_error *)
{
    // advertising is best effort; services stay registered without it
    if (!log_if_method_error(m, "[BLUEZ][server]", "RegisterAdvertisement"))
        LOG_INFO("[BLUEZ][server] advertising");
    return 0;
}

}  // namespace gatt
#endif
