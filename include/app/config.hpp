#pragma once
#include <cstdint>
#include <string>

#include "util/constants.hpp"

namespace app
{

enum class TransportKind
{
    Loopback,
    Bluez,
};

struct Config
{
    TransportKind transport{TransportKind::Loopback};
    std::string   adapter{"hci0"};
    std::string   peer;  // connect at startup when set
    std::string   device_name{constants::DEFAULT_DEVICE_NAME};
    std::uint32_t connect_delay_ms{constants::CLIENT_CONNECT_DELAY_MS};
    std::uint32_t cooldown_ms{constants::SERVER_COOLDOWN_MS};
    std::string   media_hook;
    std::string   call_hook;
    std::string   ctl_sock;
    std::string   log_level{"debug"};
};

// Reads PHONELINK_* once. Invalid values are logged and the default is kept.
Config load_config_from_env();

const char *transport_name(TransportKind t);

}  // namespace app
