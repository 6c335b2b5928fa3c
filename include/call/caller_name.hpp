#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "call/call_metadata.hpp"

namespace call
{

inline constexpr std::string_view INCOMING_PLACEHOLDER = "Incoming Call";
inline constexpr std::string_view OUTGOING_PLACEHOLDER = "Outgoing Call";

// Removes Unicode bidi embedding/isolate marks that dialers wrap around numbers.
std::string strip_bidi(std::string_view s);

bool is_placeholder_name(std::string_view name);
bool is_system_message(std::string_view text);
bool looks_like_phone_number(std::string_view text);

// Upgrade policy for out-of-band caller name hints:
//  - empty or deny-listed text never wins
//  - anything concrete replaces a missing or placeholder name
//  - a resolved name is never downgraded to a bare number or a placeholder
//  - once a concrete name is set, the first one stays
bool should_replace_name(const std::optional<std::string> &current, std::string_view candidate);

// Text for Call Friendly Name: real name, else the number, else whatever placeholder we have
std::string display_name(const CallMetadata &m);

}  // namespace call
