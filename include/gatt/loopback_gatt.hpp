#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

#include "gatt/igatt.hpp"

namespace gatt
{

// In-process GATT server: no radio, records every notification. Used when
// PHONELINK_TRANSPORT is not "bluez" and by the tests to drive peer events.
class LoopbackGattServer final : public IGattServer
{
  public:
    struct Sent
    {
        std::string device;
        CharId      id;
        Bytes       value;
    };

    bool        open(const std::vector<ServiceDef> &services, ServerCallbacks cb) override;
    void        close() override;
    bool        is_open() const override { return open_; }
    bool        set_value(CharId id, const Bytes &value) override;
    bool        notify(const std::string &device, CharId id, const Bytes &value) override;
    std::string name() const override { return "loopback"; }

    // peer side
    void connect_peer(const std::string &device);
    void disconnect_peer(const std::string &device);
    void write(const std::string &device, CharId id, const Bytes &value);
    void subscribe(CharId id, bool on);

    // fault injection
    void omit_characteristic(CharId id) { omitted_.insert(id); }
    void set_notify_fails(bool v) { notify_fails_ = v; }

    const std::vector<Sent> &sent() const { return sent_; }
    void                     clear_sent() { sent_.clear(); }
    std::vector<Bytes>       sent_to(const std::string &device, CharId id) const;
    const Bytes             *value(CharId id) const;
    int                      open_count() const { return open_count_; }
    int                      close_count() const { return close_count_; }

  private:
    ServerCallbacks         cb_{};
    bool                    open_{false};
    bool                    notify_fails_{false};
    int                     open_count_{0};
    int                     close_count_{0};
    std::set<CharId>        omitted_;
    std::set<CharId>        exported_;
    std::map<CharId, Bytes> values_;
    std::vector<Sent>       sent_;
};

// In-process GATT client: connects instantly unless told otherwise.
class LoopbackGattClient final : public IGattClient
{
  public:
    bool connect(const std::string &addr, ClientCallbacks cb) override;
    void disconnect() override;
    bool is_bonded(const std::string &addr) override { return bonded_.count(addr) != 0; }
    bool create_bond(const std::string &addr) override;
    bool discover_services() override;

    void set_auto_connect(bool v) { auto_connect_ = v; }
    void set_bonded(const std::string &addr) { bonded_.insert(addr); }
    void complete_connect(bool ok);  // when auto_connect is off
    void drop_link();                // remote side went away

    const std::string &target() const { return target_; }
    bool               connected() const { return connected_; }
    int                connect_calls() const { return connect_calls_; }
    int                bond_calls() const { return bond_calls_; }
    int                discover_calls() const { return discover_calls_; }

  private:
    ClientCallbacks       cb_{};
    std::string           target_;
    std::set<std::string> bonded_;
    bool                  auto_connect_{true};
    bool                  connected_{false};
    int                   connect_calls_{0};
    int                   bond_calls_{0};
    int                   discover_calls_{0};
};

}  // namespace gatt
