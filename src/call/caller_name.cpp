#include "call/caller_name.hpp"

#include <cctype>

#include "util/constants.hpp"

namespace call
{

namespace
{
constexpr std::string_view kPlaceholders[] = {
    "Incoming Call", "Outgoing Call",    "Active Call",  "Unknown Caller", "Unknown Number",
    "Private Number", "Blocked",         "Call in progress", "Ongoing call", "Unknown",
};

// banners some dialer/caller-id apps post in place of a name
constexpr std::string_view kSystemMessages[] = {
    "spam protection", "allow truecaller", "premium", "subscription", "tap to", "caller id by",
};

std::string lower(std::string_view s)
{
    std::string out(s);
    for (auto &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string trim(std::string_view s)
{
    const auto ws = " \t\r\n";
    auto       l  = s.find_first_not_of(ws);
    if (l == std::string_view::npos)
        return std::string();
    auto r = s.find_last_not_of(ws);
    return std::string(s.substr(l, r - l + 1));
}

std::string clean(std::string_view s)
{
    return trim(strip_bidi(s));
}
}  // namespace

std::string strip_bidi(std::string_view s)
{
    // U+200E/U+200F, U+202A..U+202E (E2 80 xx) and U+2066..U+2069 (E2 81 xx)
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i)
    {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == 0xE2 && i + 2 < s.size())
        {
            const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
            const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
            const bool          mark =
                (b1 == 0x80 && (b2 == 0x8E || b2 == 0x8F || (b2 >= 0xAA && b2 <= 0xAE))) ||
                (b1 == 0x81 && b2 >= 0xA6 && b2 <= 0xA9);
            if (mark)
            {
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

bool is_placeholder_name(std::string_view name)
{
    const std::string n = lower(clean(name));
    for (auto p : kPlaceholders)
    {
        if (n == lower(p))
            return true;
    }
    return false;
}

bool is_system_message(std::string_view text)
{
    const std::string t = lower(clean(text));
    for (auto m : kSystemMessages)
    {
        if (t.find(m) != std::string::npos)
            return true;
    }
    return false;
}

bool looks_like_phone_number(std::string_view text)
{
    const std::string t = clean(text);
    if (t.empty())
        return false;
    bool digit = false;
    for (unsigned char c : t)
    {
        if (std::isdigit(c))
            digit = true;
        else if (c != '+' && c != ' ' && c != '-' && c != '(' && c != ')')
            return false;
    }
    return digit;
}

bool should_replace_name(const std::optional<std::string> &current, std::string_view candidate)
{
    const std::string cand = clean(candidate);
    if (cand.empty() || is_system_message(cand))
        return false;

    if (!current || clean(*current).empty())
        return true;
    const std::string cur = clean(*current);
    if (cur == cand)
        return false;

    if (is_placeholder_name(cur))
        return !is_placeholder_name(cand);
    if (is_placeholder_name(cand))
        return false;

    const bool cur_num  = looks_like_phone_number(cur);
    const bool cand_num = looks_like_phone_number(cand);
    if (cur_num && !cand_num)
        return true;  // number -> contact name
    return false;     // downgrade to a number, or a second concrete name
}

std::string display_name(const CallMetadata &m)
{
    const bool have_name = m.caller_name && !clean(*m.caller_name).empty();
    if (have_name && !is_placeholder_name(*m.caller_name))
        return clean(*m.caller_name);
    if (m.phone_number && !m.phone_number->empty())
        return *m.phone_number;
    if (have_name)
        return clean(*m.caller_name);
    if (m.state == CallState::Idle)
        return std::string(constants::DEFAULT_FRIENDLY_NAME);
    return "Unknown Caller";
}

}  // namespace call
