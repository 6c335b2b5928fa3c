#pragma once

#if PHONELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace gatt
{
// org.bluez.GattService1, userdata BluezService*
extern const sd_bus_vtable k_service_vtbl[];
// org.bluez.GattCharacteristic1, userdata BluezChar*
extern const sd_bus_vtable k_char_vtbl[];
// org.bluez.LEAdvertisement1, userdata BluezGatt*
extern const sd_bus_vtable k_adv_vtbl[];

// Async replies; userdata BluezGatt*
int on_register_app_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int on_register_adv_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
}  // namespace gatt
#endif
