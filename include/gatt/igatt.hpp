#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "gatt/characteristics.hpp"
#include "proto/codec.hpp"

namespace gatt
{

using Bytes = codec::Bytes;

// Outcome of a control point write
enum class ControlResult
{
    Dispatched,   // command handed to the collaborator and accepted
    Failed,       // valid opcode, collaborator missing, refused or not implemented
    Unsupported,  // opcode outside the supported set, dropped
    Malformed,    // empty write
};

const char *control_result_name(ControlResult r);

// Server-side events. Backends may invoke these from their own I/O thread.
struct ServerCallbacks
{
    std::function<void(const std::string &device, bool connected)> on_peer;
    std::function<void(std::uint16_t svc_uuid16, bool ok, const std::vector<CharId> &chars)>
                                                                                on_service;
    std::function<void(const std::string &device, CharId id, const Bytes &value)> on_write;
    std::function<void(CharId id, bool subscribed)>                              on_subscription;
};

// GATT server: exports the service table, serves reads from the stored values, notifies.
struct IGattServer
{
    virtual bool        open(const std::vector<ServiceDef> &services, ServerCallbacks cb) = 0;
    virtual void        close()                                                       = 0;
    virtual bool        is_open() const                                               = 0;
    virtual bool        set_value(CharId id, const Bytes &value)                      = 0;
    virtual bool        notify(const std::string &device, CharId id, const Bytes &value) = 0;
    virtual std::string name() const { return ""; }
    virtual ~IGattServer() = default;
};

struct ClientCallbacks
{
    std::function<void(const std::string &addr, bool connected)> on_connection;
};

// GATT client (central role) towards the peripheral.
struct IGattClient
{
    virtual bool connect(const std::string &addr, ClientCallbacks cb) = 0;
    virtual void disconnect()                                         = 0;
    virtual bool is_bonded(const std::string &addr)                   = 0;
    virtual bool create_bond(const std::string &addr)                 = 0;  // async, no wait
    virtual bool discover_services()                                  = 0;
    virtual ~IGattClient() = default;
};

}  // namespace gatt
