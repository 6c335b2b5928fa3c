#pragma once

#if PHONELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace gatt
{
// Signal handlers; userdata BluezGatt*
int on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

// Async replies; userdata BluezGatt*
int on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int on_pair_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
}  // namespace gatt
#endif
