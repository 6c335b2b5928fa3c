#pragma once
#include <string>
#include <utility>

namespace app
{

// Whether the process may touch the Bluetooth stack at all.
struct ICapabilities
{
    virtual bool has_ble() const = 0;
    virtual ~ICapabilities()     = default;
};

class FixedCapabilities final : public ICapabilities
{
  public:
    explicit FixedCapabilities(bool ble) : ble_(ble) {}
    bool has_ble() const override { return ble_; }
    void set_ble(bool v) { ble_ = v; }

  private:
    bool ble_;
};

// Probes the adapter over the system bus on every call (permissions can change at runtime).
class AdapterCapabilities final : public ICapabilities
{
  public:
    explicit AdapterCapabilities(std::string adapter) : adapter_(std::move(adapter)) {}
    bool has_ble() const override;

  private:
    std::string adapter_;
};

}  // namespace app
