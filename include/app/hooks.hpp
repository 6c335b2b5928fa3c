#pragma once
#include <string>

#include "call/call_metadata.hpp"
#include "media/media_metadata.hpp"

namespace app
{

// Starts `exe arg` without waiting for it. true when the process was spawned;
// the exit status is only logged.
bool run_hook(const std::string &exe, const char *arg);

class HookMediaSource final : public media::IMediaSource
{
  public:
    explicit HookMediaSource(std::string exe) : exe_(std::move(exe)) {}
    bool execute(media::MediaCommand cmd) override;

  private:
    std::string exe_;
};

// Accept/reject/end only; hold is never advertised as supported.
class HookTelephony final : public call::ITelephony
{
  public:
    explicit HookTelephony(std::string exe) : exe_(std::move(exe)) {}
    bool supports(call::CallCommand cmd) const override;
    bool execute(call::CallCommand cmd) override;

  private:
    std::string exe_;
};

}  // namespace app
