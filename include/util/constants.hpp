#pragma once
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Bluetooth SIG assigned numbers (16-bit, expanded with the base UUID below)
inline constexpr uint16_t GAP_SVC          = 0x1800;
inline constexpr uint16_t GAP_DEVICE_NAME  = 0x2A00;
inline constexpr uint16_t GAP_APPEARANCE   = 0x2A01;

inline constexpr uint16_t MCS_SVC            = 0x1849;
inline constexpr uint16_t MCS_PLAYER_NAME    = 0x2B93;
inline constexpr uint16_t MCS_TRACK_CHANGED  = 0x2B96;
inline constexpr uint16_t MCS_TRACK_TITLE    = 0x2B97;
inline constexpr uint16_t MCS_TRACK_DURATION = 0x2B98;
inline constexpr uint16_t MCS_TRACK_POSITION = 0x2B99;
inline constexpr uint16_t MCS_MEDIA_STATE    = 0x2BA3;
inline constexpr uint16_t MCS_CONTROL_POINT  = 0x2BA4;
inline constexpr uint16_t MCS_OPCODES        = 0x2BA5;

inline constexpr uint16_t TBS_SVC                = 0x184C;
inline constexpr uint16_t TBS_CALL_STATE         = 0x2BBD;
inline constexpr uint16_t TBS_CONTROL_POINT      = 0x2BBE;
inline constexpr uint16_t TBS_TERMINATION_REASON = 0x2BC0;
inline constexpr uint16_t TBS_FRIENDLY_NAME      = 0x2BC2;

inline constexpr std::string_view BASE_UUID_SUFFIX = "-0000-1000-8000-00805f9b34fb";

// "0000xxxx-0000-1000-8000-00805f9b34fb", lower case as BlueZ reports it
inline std::string uuid16_to_string(uint16_t u16)
{
    char head[9];
    std::snprintf(head, sizeof(head), "0000%04x", (unsigned)u16);
    return std::string(head) + std::string(BASE_UUID_SUFFIX);
}

// Defaults shown before any producer has reported
inline constexpr std::string_view DEFAULT_PLAYER_NAME   = "MediaPlayer";
inline constexpr std::string_view DEFAULT_TRACK_TITLE   = "No Media";
inline constexpr std::string_view DEFAULT_FRIENDLY_NAME = "No Active Call";
inline constexpr std::string_view DEFAULT_DEVICE_NAME   = "phonelink";

// Session timing (ms)
inline constexpr uint32_t CLIENT_CONNECT_DELAY_MS = 100;
inline constexpr uint32_t SERVER_COOLDOWN_MS      = 800;
inline constexpr uint32_t SUB_MONITOR_FIRST_MS    = 3000;
inline constexpr uint32_t SUB_MONITOR_PERIOD_MS   = 2000;
inline constexpr int      SUB_MONITOR_MAX_CHECKS  = 10;

// Call reconciliation timing (ms)
inline constexpr uint64_t DIAL_WATCHDOG_MS      = 5000;
inline constexpr uint64_t DIAL_ANSWER_MIN_MS    = 500;
inline constexpr uint64_t NEW_CALL_MIN_GAP_MS   = 1000;

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("PHONELINK_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/phonelink/ctl.sock";
    LOG_SYSTEM("Control socket defaults to %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
