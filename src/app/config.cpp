#include "app/config.hpp"

#include <cctype>
#include <cstdlib>

#include "ctl/ipc.hpp"
#include "util/address.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{
const char *env(const char *key)
{
    const char *v = std::getenv(key);
    return (v && *v) ? v : nullptr;
}

// strtoul with full-string and range check
void read_ms(const char *key, std::uint32_t max, std::uint32_t &out)
{
    const char *e = env(key);
    if (!e)
        return;
    char         *p = nullptr;
    unsigned long v = std::strtoul(e, &p, 10);
    if (p && *p == '\0' && std::isdigit(static_cast<unsigned char>(e[0])) && v <= max)
    {
        out = static_cast<std::uint32_t>(v);
        LOG_INFO("Using %s=%u", key, (unsigned)out);
        return;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect 0..%u)", key, e, (unsigned)max);
}
}  // namespace

const char *transport_name(TransportKind t)
{
    return t == TransportKind::Bluez ? "bluez" : "loopback";
}

Config load_config_from_env()
{
    Config cfg;

    if (const char *t = env("PHONELINK_TRANSPORT"))
    {
        std::string ts = t;
        for (auto &c : ts)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (ts == "bluez")
            cfg.transport = TransportKind::Bluez;
        else if (ts != "loopback")
            LOG_WARN("Ignoring unknown PHONELINK_TRANSPORT='%s' (bluez|loopback)", t);
    }
    if (const char *a = env("PHONELINK_ADAPTER"))
        cfg.adapter = a;
    if (const char *p = env("PHONELINK_PEER"))
    {
        std::string mac = address::normalize(p);
        if (address::is_valid(mac))
            cfg.peer = mac;
        else
            LOG_WARN("Ignoring invalid PHONELINK_PEER='%s'", p);
    }
    if (const char *n = env("PHONELINK_DEVICE_NAME"))
        cfg.device_name = n;

    read_ms("PHONELINK_CONNECT_DELAY_MS", 5000, cfg.connect_delay_ms);
    read_ms("PHONELINK_COOLDOWN_MS", 10000, cfg.cooldown_ms);

    if (const char *h = env("PHONELINK_MEDIA_HOOK"))
        cfg.media_hook = ipc::expand_user(h);
    if (const char *h = env("PHONELINK_CALL_HOOK"))
        cfg.call_hook = ipc::expand_user(h);
    if (const char *l = env("PHONELINK_LOG_LEVEL"))
        cfg.log_level = l;

    cfg.ctl_sock = ipc::expand_user(constants::ctl_sock_path());
    return cfg;
}

}  // namespace app
