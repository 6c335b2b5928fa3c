#pragma once
#include <set>
#include <string>

#include "gatt/characteristics.hpp"

namespace gatt
{

// Connected peers on the GATT server, the subset still waiting for a full snapshot, and the
// characteristics a client has enabled notifications on.
class DeviceRegistry
{
  public:
    bool add(const std::string &addr);     // false if already connected
    bool remove(const std::string &addr);  // also drops it from the recent set
    void clear();

    void mark_recent(const std::string &addr);
    void clear_recent(const std::string &addr);

    bool contains(const std::string &addr) const { return connected_.count(addr) != 0; }
    bool is_recent(const std::string &addr) const { return recent_.count(addr) != 0; }
    bool empty() const { return connected_.empty(); }

    const std::set<std::string> &connected() const { return connected_; }
    const std::set<std::string> &recent() const { return recent_; }

    void                    set_subscribed(CharId id, bool on);
    bool                    any_subscription() const { return !subscribed_.empty(); }
    bool                    subscribed(CharId id) const { return subscribed_.count(id) != 0; }
    const std::set<CharId> &subscriptions() const { return subscribed_; }

  private:
    std::set<std::string> connected_;
    std::set<std::string> recent_;
    std::set<CharId>      subscribed_;
};

}  // namespace gatt
