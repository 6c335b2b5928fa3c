#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "gatt/device_registry.hpp"
#include "gatt/igatt.hpp"

namespace gatt
{

// Change-detection cache in front of IGattServer::notify.
//  - changed value            -> every connected device, cache updated
//  - unchanged, recent peers  -> only the recently connected devices
//  - otherwise                -> nothing
class NotificationGate
{
  public:
    struct Decision
    {
        std::vector<std::string> recipients;
        bool                     changed{false};
    };

    Decision decide(CharId id, const Bytes &value, const DeviceRegistry &reg);

    // decide + store readable value + notify; returns the number of successful notifies.
    // force: send to every connected device even if the cache matches.
    std::size_t publish(IGattServer          &server,
                        CharId                id,
                        const Bytes          &value,
                        const DeviceRegistry &reg,
                        bool                  force = false);

    const Bytes *cached(CharId id) const;

  private:
    std::map<CharId, Bytes> last_sent_;
};

}  // namespace gatt
