// include/gatt/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#if PHONELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

#include "util/log.hpp"

// "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF" -> "AA:BB:CC:DD:EE:FF", "" if not a device path
[[maybe_unused]] static inline std::string address_from_path(const std::string &obj_path)
{
    auto pos = obj_path.rfind("/dev_");
    if (pos == std::string::npos)
        return std::string();
    std::string tail = obj_path.substr(pos + 5);
    if (tail.size() != 17 || tail.find('/') != std::string::npos)
        return std::string();
    for (auto &c : tail)
        c = (c == '_') ? ':' : (char)std::toupper((unsigned char)c);
    return tail;
}

// device object directly under the adapter (not one of its GATT children)
[[maybe_unused]] static inline bool is_device_path(const std::string &obj_path,
                                                   const std::string &adapter_path)
{
    const std::string prefix = adapter_path + "/dev_";
    return obj_path.rfind(prefix, 0) == 0 &&
           obj_path.find('/', prefix.size()) == std::string::npos;
}

#if PHONELINK_HAVE_SDBUS
[[maybe_unused]] static inline int read_var_b(sd_bus_message *m, bool &out)
{
    // read variant "b"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "b");
    if (r < 0)
        return r;
    int b = 0;
    r     = sd_bus_message_read(m, "b", &b);
    if (r >= 0)
        out = (b != 0);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_q(sd_bus_message *m, uint16_t &out)
{
    // read variant "q" (uint16)
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "q");
    if (r < 0)
        return r;
    r      = sd_bus_message_read(m, "q", &out);
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int read_var_o(sd_bus_message *m, std::string &out)
{
    // read variant "o"
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "o");
    if (r < 0)
        return r;
    const char *o = nullptr;
    r             = sd_bus_message_read(m, "o", &o);
    if (r >= 0 && o)
        out = o;
    int r2 = sd_bus_message_exit_container(m);
    return r < 0 ? r : r2;
}

[[maybe_unused]] static inline int append_string_array(sd_bus_message                 *reply,
                                                       const std::vector<std::string> &items)
{
    int r = sd_bus_message_open_container(reply, 'a', "s");
    if (r < 0)
        return r;
    for (const auto &s : items)
    {
        r = sd_bus_message_append_basic(reply, 's', s.c_str());
        if (r < 0)
            return r;
    }
    return sd_bus_message_close_container(reply);
}

// true (and logs) when m is a method error reply
[[maybe_unused]] static inline bool log_if_method_error(sd_bus_message *m,
                                                        const char     *tag,
                                                        const char     *what)
{
    if (!sd_bus_message_is_method_error(m, nullptr))
        return false;
    const sd_bus_error *e = sd_bus_message_get_error(m);
    LOG_ERROR("%s %s failed: %s: %s", tag, what, e && e->name ? e->name : "unknown",
              e && e->message ? e->message : "no message");
    return true;
}

// ======================================================================
// Function: emit_value_changed
// - In: bus valid, char_path exported, payload bytes
// - Out: sends PropertiesChanged with Value=ay on the characteristic
// - Note: BlueZ turns this into a notification for every subscribed client
// ======================================================================
[[maybe_unused]] static bool emit_value_changed(sd_bus                     *bus,
                                                const std::string          &char_path,
                                                const std::vector<uint8_t> &value)
{
    if (!bus)
        return false;
    sd_bus_message *sig = nullptr;
    int             r   = sd_bus_message_new_signal(bus, &sig, char_path.c_str(),
                                                    "org.freedesktop.DBus.Properties", "PropertiesChanged");
    // clang-format off
    if (r < 0) goto fail_new;
    r = sd_bus_message_append(sig, "s", "org.bluez.GattCharacteristic1");
    if (r < 0) goto fail;
    r = sd_bus_message_open_container(sig, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0) goto fail;
    r = sd_bus_message_open_container(sig, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r < 0) goto fail;
    r = sd_bus_message_append(sig, "s", "Value");
    if (r < 0) goto fail;
    r = sd_bus_message_open_container(sig, SD_BUS_TYPE_VARIANT, "ay");
    if (r < 0) goto fail;
    r = sd_bus_message_append_array(sig, 'y', value.data(), value.size());
    if (r < 0) goto fail;
    r = sd_bus_message_close_container(sig); /* variant */
    if (r < 0) goto fail;
    r = sd_bus_message_close_container(sig); /* dict entry */
    if (r < 0) goto fail;
    r = sd_bus_message_close_container(sig); /* a{sv} */
    if (r < 0) goto fail;
    // invalidated props: empty 'as'
    r = sd_bus_message_open_container(sig, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0) goto fail;
    r = sd_bus_message_close_container(sig);
    if (r < 0) goto fail;
    r = sd_bus_send(bus, sig, nullptr);
    sd_bus_message_unref(sig);
    return (r >= 0);
    // clang-format on
fail:
    if (sig)
        sd_bus_message_unref(sig);
fail_new:
    return false;
}
#endif
