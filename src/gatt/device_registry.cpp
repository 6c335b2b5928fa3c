#include "gatt/device_registry.hpp"

namespace gatt
{

bool DeviceRegistry::add(const std::string &addr)
{
    if (addr.empty())
        return false;
    return connected_.insert(addr).second;
}

bool DeviceRegistry::remove(const std::string &addr)
{
    recent_.erase(addr);
    return connected_.erase(addr) != 0;
}

void DeviceRegistry::clear()
{
    connected_.clear();
    recent_.clear();
    subscribed_.clear();
}

void DeviceRegistry::mark_recent(const std::string &addr)
{
    if (contains(addr))
        recent_.insert(addr);
}

void DeviceRegistry::clear_recent(const std::string &addr)
{
    recent_.erase(addr);
}

void DeviceRegistry::set_subscribed(CharId id, bool on)
{
    if (on)
        subscribed_.insert(id);
    else
        subscribed_.erase(id);
}

}  // namespace gatt
