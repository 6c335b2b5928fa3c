#pragma once
#include <cctype>
#include <string>

namespace address
{

// "AA:BB:CC:DD:EE:FF", either case
inline bool is_valid(const std::string &mac)
{
    if (mac.size() != 17)
        return false;
    for (size_t i = 0; i < mac.size(); ++i)
    {
        if ((i % 3) == 2)
        {
            if (mac[i] != ':')
                return false;
        }
        else if (!std::isxdigit(static_cast<unsigned char>(mac[i])))
        {
            return false;
        }
    }
    return true;
}

inline std::string normalize(std::string mac)
{
    for (auto &c : mac)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return mac;
}

// BlueZ object path fragment: AA:BB -> AA_BB
inline std::string to_path_fragment(const std::string &mac)
{
    std::string out = normalize(mac);
    for (auto &c : out)
    {
        if (c == ':')
            c = '_';
    }
    return out;
}

}  // namespace address
