#include <cstdio>
#include <cstdlib>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctl/commands.hpp"
#include "ctl/ipc.hpp"
#include "util/address.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string to_upper(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::string join(const std::vector<std::string> &args, size_t from, char sep)
{
    std::string out;
    for (size_t i = from; i < args.size(); ++i)
    {
        if (i > from)
            out.push_back(sep);
        out += args[i];
    }
    return out;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  phonelinkctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  connect AA:BB:CC:DD:EE:FF\n"
                         "  disconnect\n"
                         "  status\n"
                         "  media key=value...   (title artist album pkg playing duration position)\n"
                         "  call idle|ringing|offhook [number]\n"
                         "  name <caller name...>\n"
                         "  quit\n");
}

int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }

    // the daemon would drop it anyway; fail here with the reason
    std::string err;
    if (!ctl::parse_command(line, &err))
    {
        std::fprintf(stderr, "error: %s\n", err.c_str());
        return exitc::bad_args;
    }

    std::string out = line;
    out.push_back('\n');
    if (!ipc::send_line(sock, out))
    {
        std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
        return exitc::no_server;
    }
    return exitc::ok;
}

int run_cmd(const std::string                             &cmd,
            const std::vector<std::string>                &args,
            const std::function<int(const std::string &)> &send_line)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"connect",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string mac = to_upper(args[1]);
             if (!address::is_valid(mac))
             {
                 std::fprintf(stderr, "error: invalid MAC address: %s\n", args[1].c_str());
                 return exitc::bad_args;
             }
             return send_line("CONNECT " + mac);
         }},
        {"disconnect", [&]() -> int { return send_line("DISCONNECT"); }},
        {"status", [&]() -> int { return send_line("STATUS"); }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
        {"media",
         [&]() -> int {
             std::vector<std::string> fields(args.begin() + 1, args.end());
             return send_line(ctl::media_line(fields));
         }},
        {"call",
         [&]() -> int {
             if (args.size() < 2 || args.size() > 3)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             std::string state = to_lower(args[1]);
             if (state != "idle" && state != "ringing" && state != "offhook")
             {
                 std::fprintf(stderr, "error: call expects idle, ringing or offhook\n");
                 return exitc::bad_args;
             }
             std::string line = "CALL\t" + to_upper(state);
             if (args.size() == 3)
                 line += "\t" + args[2];
             return send_line(line);
         }},
        {"name",
         [&]() -> int {
             if (args.size() < 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line("NAME\t" + join(args, 1, ' '));
         }},
    };

    auto it = cmd_map.find(to_lower(cmd));
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    if (const char *log_level = std::getenv("PHONELINK_LOG_LEVEL"))
        phonelink::set_log_level_by_name(log_level);

    // env override is inside ctl_sock_path(); --sock overrides both
    std::string sock;
    bool        sock_given = false;

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock" && i + 1 < argc)
        {
            sock       = ipc::expand_user(argv[++i]);
            sock_given = true;
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }
    if (!sock_given)
        sock = ipc::expand_user(constants::ctl_sock_path());

    const std::string &cmd = args[0];
    auto sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    return run_cmd(cmd, args, sender);
}
