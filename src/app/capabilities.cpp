#include "app/capabilities.hpp"

#include "gatt/bluez_gatt.hpp"

namespace app
{

bool AdapterCapabilities::has_ble() const
{
    return gatt::bluez_adapter_present(adapter_);
}

}  // namespace app
