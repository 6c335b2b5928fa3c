#pragma once
#include <optional>
#include <string>
#include <vector>

#include "call/call_reconciler.hpp"
#include "media/media_metadata.hpp"

namespace ctl
{

enum class CommandKind
{
    Connect,
    Disconnect,
    Status,
    Quit,
    Media,
    Call,
    Name,
};

struct Command
{
    CommandKind              kind{CommandKind::Status};
    std::string              address;  // Connect
    media::MediaMetadata     media;    // Media
    call::CallMetadataUpdate call;     // Call
    std::string              name;     // Name
};

// Control socket line -> command. On failure returns nullopt and fills *error when given.
//   CONNECT AA:BB:CC:DD:EE:FF | DISCONNECT | STATUS | QUIT
//   MEDIA\tkey=value...      keys: title artist album pkg playing duration position
//   CALL\tIDLE|RINGING|OFFHOOK[\tnumber]
//   NAME\t<caller name>
std::optional<Command> parse_command(const std::string &line, std::string *error = nullptr);

// Inverse for the CLI: "title=x", "playing=1" ... -> "MEDIA\ttitle=x\tplaying=1"
std::string media_line(const std::vector<std::string> &fields);

}  // namespace ctl
