#include "ctl/commands.hpp"

#include <cctype>
#include <cstdlib>

#include "util/address.hpp"

namespace ctl
{

namespace
{
std::string upper(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string &s)
{
    auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return std::string();
    auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}

std::vector<std::string> split_tabs(const std::string &s)
{
    std::vector<std::string> out;
    size_t                   start = 0;
    for (;;)
    {
        auto pos = s.find('\t', start);
        out.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos)
            break;
        start = pos + 1;
    }
    return out;
}

bool parse_u64(const std::string &s, std::uint64_t &out)
{
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
        return false;
    char              *end = nullptr;
    unsigned long long v   = std::strtoull(s.c_str(), &end, 10);
    if (!end || *end != '\0')
        return false;
    out = v;
    return true;
}

bool fail(std::string *error, const std::string &msg)
{
    if (error)
        *error = msg;
    return false;
}

bool parse_media_field(const std::string &field, media::MediaMetadata &m, std::string *error)
{
    auto eq = field.find('=');
    if (eq == std::string::npos || eq == 0)
        return fail(error, "expected key=value, got '" + field + "'");
    const std::string key = field.substr(0, eq);
    const std::string val = field.substr(eq + 1);

    if (key == "title")
        m.title = val.empty() ? std::nullopt : std::optional<std::string>(val);
    else if (key == "artist")
        m.artist = val;
    else if (key == "album")
        m.album = val;
    else if (key == "pkg")
        m.source_package = val.empty() ? std::nullopt : std::optional<std::string>(val);
    else if (key == "playing")
    {
        if (val == "1" || val == "true")
            m.is_playing = true;
        else if (val == "0" || val == "false")
            m.is_playing = false;
        else
            return fail(error, "playing expects 0 or 1");
    }
    else if (key == "duration")
    {
        if (!parse_u64(val, m.duration_ms))
            return fail(error, "duration expects milliseconds");
    }
    else if (key == "position")
    {
        if (!parse_u64(val, m.position_ms))
            return fail(error, "position expects milliseconds");
    }
    else
        return fail(error, "unknown media key '" + key + "'");
    return true;
}
}  // namespace

std::optional<Command> parse_command(const std::string &raw, std::string *error)
{
    const std::string line = trim(raw);
    if (line.empty())
    {
        fail(error, "empty line");
        return std::nullopt;
    }

    auto              sep  = line.find_first_of(" \t");
    const std::string verb = upper(line.substr(0, sep));
    const std::string rest = sep == std::string::npos ? std::string() : line.substr(sep + 1);

    Command cmd;
    if (verb == "CONNECT")
    {
        std::string mac = address::normalize(trim(rest));
        if (!address::is_valid(mac))
        {
            fail(error, "invalid address '" + trim(rest) + "'");
            return std::nullopt;
        }
        cmd.kind    = CommandKind::Connect;
        cmd.address = mac;
        return cmd;
    }
    if (verb == "DISCONNECT" || verb == "STATUS" || verb == "QUIT")
    {
        if (!trim(rest).empty())
        {
            fail(error, verb + " takes no arguments");
            return std::nullopt;
        }
        cmd.kind = verb == "DISCONNECT" ? CommandKind::Disconnect
                   : verb == "STATUS"   ? CommandKind::Status
                                        : CommandKind::Quit;
        return cmd;
    }
    if (verb == "MEDIA")
    {
        cmd.kind = CommandKind::Media;
        if (rest.empty())
            return cmd;  // no fields: media stopped
        for (const auto &f : split_tabs(rest))
        {
            if (f.empty())
                continue;
            if (!parse_media_field(f, cmd.media, error))
                return std::nullopt;
        }
        return cmd;
    }
    if (verb == "CALL")
    {
        auto fields = split_tabs(rest);
        const std::string st = upper(trim(fields[0]));
        if (st == "IDLE")
            cmd.call.state = call::TelephonyState::Idle;
        else if (st == "RINGING")
            cmd.call.state = call::TelephonyState::Ringing;
        else if (st == "OFFHOOK")
            cmd.call.state = call::TelephonyState::Offhook;
        else
        {
            fail(error, "CALL expects IDLE, RINGING or OFFHOOK");
            return std::nullopt;
        }
        if (fields.size() > 1 && !trim(fields[1]).empty())
            cmd.call.phone_number = trim(fields[1]);
        if (fields.size() > 2 && !trim(fields[2]).empty())
            cmd.call.caller_name = trim(fields[2]);
        cmd.kind = CommandKind::Call;
        return cmd;
    }
    if (verb == "NAME")
    {
        cmd.name = trim(rest);
        if (cmd.name.empty())
        {
            fail(error, "NAME expects a caller name");
            return std::nullopt;
        }
        cmd.kind = CommandKind::Name;
        return cmd;
    }

    fail(error, "unknown command '" + verb + "'");
    return std::nullopt;
}

std::string media_line(const std::vector<std::string> &fields)
{
    std::string out = "MEDIA";
    for (const auto &f : fields)
    {
        out.push_back('\t');
        out += f;
    }
    return out;
}

}  // namespace ctl
