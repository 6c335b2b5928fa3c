#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

struct sd_bus;
struct sd_bus_slot;

#include "gatt/bluez_gatt.hpp"

namespace gatt
{

// One exported org.bluez.GattCharacteristic1 object; also the vtable userdata.
struct BluezChar
{
    BluezGatt   *owner = nullptr;
    CharId       id{};
    std::uint8_t flags = 0;
    std::string  uuid;
    std::string  path;      // /org/phonelink/app/serviceN/charM
    std::string  svc_path;  // owning service
    bool         notifying = false;
    Bytes        value;
    sd_bus_slot *slot = nullptr;
};

// One exported org.bluez.GattService1 object
struct BluezService
{
    std::uint16_t       uuid16 = 0;
    std::string         name;
    std::string         uuid;
    std::string         path;
    std::vector<CharId> chars;  // successfully exported
    sd_bus_slot        *slot = nullptr;
};

struct BluezGatt::Impl
{
    sd_bus *bus = nullptr;

    // signal matches (lifetime of start/stop)
    sd_bus_slot *props_slot   = nullptr;  // PropertiesChanged from org.bluez
    sd_bus_slot *removed_slot = nullptr;  // InterfacesRemoved

    // server objects (lifetime of open/close)
    sd_bus_slot *app_slot      = nullptr;  // ObjectManager at app_path
    sd_bus_slot *reg_slot      = nullptr;  // RegisterApplication (async)
    sd_bus_slot *adv_obj_slot  = nullptr;  // LEAdvertisement1 vtable
    sd_bus_slot *adv_call_slot = nullptr;  // RegisterAdvertisement (async)

    // client calls in flight
    sd_bus_slot *connect_call_slot = nullptr;
    sd_bus_slot *pair_call_slot    = nullptr;

    // serialize all sd-bus access
    std::mutex  bus_mu;
    std::thread loop;

    std::string adapter_path;  // "/org/bluez/hci0"
    std::string app_path = "/org/phonelink/app";
    std::string adv_path = "/org/phonelink/adv0";
    std::string unique_name;

    // server state, guarded by bus_mu
    bool                                       server_open = false;
    bool                                       registered  = false;
    ServerCallbacks                            server_cb{};
    std::vector<std::unique_ptr<BluezService>> services;
    std::vector<std::unique_ptr<BluezChar>>    chars;
    std::map<CharId, BluezChar *>              by_id;
    std::set<std::string>                      peers;  // connected device paths

    // client state, guarded by bus_mu
    ClientCallbacks client_cb{};
    std::string     client_addr;
    std::string     client_dev_path;
    bool            client_connected = false;
};

}  // namespace gatt
