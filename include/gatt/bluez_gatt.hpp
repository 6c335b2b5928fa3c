#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "gatt/igatt.hpp"
#include "util/constants.hpp"

#if PHONELINK_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace
{
// TU-local wrapper to unref and null a slot ptr
inline void unref_slot(sd_bus_slot *&s)
{
    if (s)
    {
        sd_bus_slot_unref(s);
        s = nullptr;
    }
}
}  // namespace

#endif

namespace gatt
{

struct BluezConfig
{
    std::string adapter    = "hci0";
    std::string local_name = std::string(constants::DEFAULT_DEVICE_NAME);  // advertised name
};

struct BluezChar;

// true when org.bluez exposes /org/bluez/<adapter> on the system bus
bool bluez_adapter_present(const std::string &adapter);

// BlueZ over sd-bus: GATT application + LE advertisement (server role) and
// Device1 connect/pair (client role) on one system bus connection.
class BluezGatt final : public IGattServer, public IGattClient
{
  public:
    explicit BluezGatt(BluezConfig cfg);
    ~BluezGatt() override;

    bool start();  // system bus, signal matches, bus loop thread
    void stop();
    bool is_running() const noexcept { return running_.load(std::memory_order_relaxed); }

    // IGattServer
    bool        open(const std::vector<ServiceDef> &services, ServerCallbacks cb) override;
    void        close() override;
    bool        is_open() const override;
    bool        set_value(CharId id, const Bytes &value) override;
    bool        notify(const std::string &device, CharId id, const Bytes &value) override;
    std::string name() const override { return "bluez"; }

    // IGattClient
    bool connect(const std::string &addr, ClientCallbacks cb) override;
    void disconnect() override;
    bool is_bonded(const std::string &addr) override;
    bool create_bond(const std::string &addr) override;
    bool discover_services() override;

    const BluezConfig &config() const { return cfg_; }

    // impl accessors for the sd-bus handlers
    const std::string       &adapter_path() const;
    const std::string       &app_path() const;
    const std::string       &unique_name() const;
    std::vector<std::string> advertised_uuids() const;

    // bus thread, bus_mu held: sd-bus handlers report here
    void handle_app_registered(bool ok);
    void handle_device_connected(const std::string &dev_path, bool connected);
    void handle_device_removed(const std::string &dev_path);
    void handle_services_resolved(const std::string &dev_path, bool resolved);
    void handle_write(BluezChar &chr, const std::string &dev_path, const Bytes &value);
    void handle_notify_state(BluezChar &chr, bool on);
    void handle_connect_reply(bool ok);

  private:
    std::string device_path(const std::string &addr) const;
    void        release_objects();  // bus_mu held

    BluezConfig      cfg_;
    std::atomic_bool running_{false};

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace gatt
