#include "gatt/notify_gate.hpp"

#include "util/log.hpp"

namespace gatt
{

NotificationGate::Decision NotificationGate::decide(CharId                id,
                                                    const Bytes          &value,
                                                    const DeviceRegistry &reg)
{
    Decision d;
    auto     it = last_sent_.find(id);
    if (it == last_sent_.end() || it->second != value)
    {
        d.changed = true;
        d.recipients.assign(reg.connected().begin(), reg.connected().end());
        last_sent_[id] = value;
        return d;
    }
    if (!reg.recent().empty())
        d.recipients.assign(reg.recent().begin(), reg.recent().end());
    return d;
}

std::size_t NotificationGate::publish(IGattServer          &server,
                                      CharId                id,
                                      const Bytes          &value,
                                      const DeviceRegistry &reg,
                                      bool                  force)
{
    Decision d;
    if (force)
    {
        d.changed = true;
        d.recipients.assign(reg.connected().begin(), reg.connected().end());
        last_sent_[id] = value;
    }
    else
    {
        d = decide(id, value, reg);
    }

    if (d.recipients.empty())
    {
        if (d.changed && !server.set_value(id, value))
            LOG_DEBUG("[GATT] %s: storing value failed", char_name(id));
        else if (!d.changed)
            LOG_DEBUG("[GATT] %s unchanged, no new devices (skip)", char_name(id));
        return 0;
    }

    if (!server.set_value(id, value))
        LOG_WARN("[GATT] %s: storing value failed", char_name(id));

    std::size_t ok = 0;
    for (const auto &dev : d.recipients)
    {
        if (server.notify(dev, id, value))
            ++ok;
        else
            LOG_WARN("[GATT] notify %s -> %s failed (no retry)", char_name(id), dev.c_str());
    }
    LOG_DEBUG("[GATT] %s [%s] %s -> %zu/%zu device(s)", char_name(id),
              codec::to_hex(value).c_str(), force ? "forced" : (d.changed ? "changed" : "snapshot"),
              ok, d.recipients.size());
    return ok;
}

const Bytes *NotificationGate::cached(CharId id) const
{
    auto it = last_sent_.find(id);
    return it == last_sent_.end() ? nullptr : &it->second;
}

}  // namespace gatt
