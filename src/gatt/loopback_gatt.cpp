#include "gatt/loopback_gatt.hpp"

#include "util/log.hpp"

namespace gatt
{

// ============== LoopbackGattServer ==============

bool LoopbackGattServer::open(const std::vector<ServiceDef> &services, ServerCallbacks cb)
{
    if (open_)
        return false;
    cb_   = std::move(cb);
    open_ = true;
    ++open_count_;
    exported_.clear();
    values_.clear();

    for (const auto &svc : services)
    {
        std::vector<CharId> present;
        for (const auto &c : svc.chars)
        {
            if (omitted_.count(c.id))
                continue;
            present.push_back(c.id);
            exported_.insert(c.id);
        }
        if (cb_.on_service)
            cb_.on_service(svc.uuid16, true, present);
    }
    return true;
}

void LoopbackGattServer::close()
{
    if (!open_)
        return;
    open_ = false;
    ++close_count_;
    exported_.clear();
    values_.clear();
    cb_ = ServerCallbacks{};
}

bool LoopbackGattServer::set_value(CharId id, const Bytes &value)
{
    if (!open_ || !exported_.count(id))
        return false;
    values_[id] = value;
    return true;
}

bool LoopbackGattServer::notify(const std::string &device, CharId id, const Bytes &value)
{
    if (!open_ || notify_fails_ || !exported_.count(id))
        return false;
    sent_.push_back(Sent{device, id, value});
    return true;
}

void LoopbackGattServer::connect_peer(const std::string &device)
{
    if (open_ && cb_.on_peer)
        cb_.on_peer(device, true);
}

void LoopbackGattServer::disconnect_peer(const std::string &device)
{
    if (open_ && cb_.on_peer)
        cb_.on_peer(device, false);
}

void LoopbackGattServer::write(const std::string &device, CharId id, const Bytes &value)
{
    if (open_ && cb_.on_write)
        cb_.on_write(device, id, value);
}

void LoopbackGattServer::subscribe(CharId id, bool on)
{
    if (open_ && cb_.on_subscription)
        cb_.on_subscription(id, on);
}

std::vector<Bytes> LoopbackGattServer::sent_to(const std::string &device, CharId id) const
{
    std::vector<Bytes> out;
    for (const auto &s : sent_)
    {
        if (s.device == device && s.id == id)
            out.push_back(s.value);
    }
    return out;
}

const Bytes *LoopbackGattServer::value(CharId id) const
{
    auto it = values_.find(id);
    return it == values_.end() ? nullptr : &it->second;
}

// ============== LoopbackGattClient ==============

bool LoopbackGattClient::connect(const std::string &addr, ClientCallbacks cb)
{
    ++connect_calls_;
    cb_     = std::move(cb);
    target_ = addr;
    LOG_DEBUG("[LOOPBACK][client] connect %s", addr.c_str());
    if (auto_connect_)
        complete_connect(true);
    return true;
}

void LoopbackGattClient::complete_connect(bool ok)
{
    connected_ = ok;
    if (cb_.on_connection)
        cb_.on_connection(target_, ok);
}

void LoopbackGattClient::disconnect()
{
    connected_ = false;
    target_.clear();
}

void LoopbackGattClient::drop_link()
{
    if (!connected_)
        return;
    connected_ = false;
    if (cb_.on_connection)
        cb_.on_connection(target_, false);
}

bool LoopbackGattClient::create_bond(const std::string &addr)
{
    ++bond_calls_;
    bonded_.insert(addr);
    return true;
}

bool LoopbackGattClient::discover_services()
{
    ++discover_calls_;
    return connected_;
}

}  // namespace gatt
