#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

namespace
{

bool make_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;

    if (!fs::exists(dir, ec) && !fs::create_directories(dir, ec))
    {
        LOG_ERROR("[IPC] mkdir %s failed: %s", dir.string().c_str(), ec.message().c_str());
        return false;
    }
    // control socket is per-user
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("[IPC] chmod 0700 %s failed: %s", dir.string().c_str(), ec.message().c_str());
    return true;
}

void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Fills addr; false (errno set) when the path does not fit sun_path.
bool fill_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("[IPC] empty socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("[IPC] path too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, sock_path.c_str(), sock_path.size() + 1);
    len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + sock_path.size() + 1);
    return true;
}

int fail_close(int fd, const char *what)
{
    int saved = errno;
    close(fd);
    errno = saved;
    LOG_ERROR("[IPC] %s failed: %s", what, std::strerror(errno));
    return -1;
}

int open_listener(const std::string &sock_path)
{
    sockaddr_un addr;
    socklen_t   len = 0;
    if (!fill_addr(sock_path, addr, len) || !make_parent_dir(sock_path))
        return -1;

    if (::unlink(sock_path.c_str()) == -1 && errno != ENOENT)
        LOG_WARN("[IPC] stale socket %s not removed: %s", sock_path.c_str(), std::strerror(errno));

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("[IPC] socket() failed: %s", std::strerror(errno));
        return -1;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), len) == -1)
        return fail_close(fd, "bind()");
    if (listen(fd, 4) == -1)
    {
        unlink(sock_path.c_str());
        return fail_close(fd, "listen()");
    }
    return fd;
}

// Reads until the first '\n' or EOF. false on a receive error.
bool read_first_line(int fd, std::string &out)
{
    std::string buf;
    char        chunk[256];
    for (;;)
    {
        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n > 0)
        {
            buf.append(chunk, static_cast<size_t>(n));
            if (buf.find('\n') != std::string::npos)
                break;
            continue;
        }
        if (n == 0)
            break;
        if (errno == EINTR)
            continue;
        LOG_ERROR("[IPC] recv() failed: %s", std::strerror(errno));
        return false;
    }

    auto pos = buf.find('\n');
    out      = pos == std::string::npos ? buf : buf.substr(0, pos);
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    return true;
}

}  // namespace

bool start_server(const std::string &sock_path, const LineHandler &on_line)
{
    int fd = open_listener(sock_path);
    if (fd == -1)
        return false;

    LOG_DEBUG("[IPC] listening on %s", sock_path.c_str());

    bool ok = true;
    for (bool serving = true; serving;)
    {
        int conn = accept(fd, nullptr, nullptr);
        if (conn == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("[IPC] accept() failed: %s", std::strerror(errno));
            ok = false;
            break;
        }
        set_cloexec(conn);

        std::string line;
        const bool  got = read_first_line(conn, line);
        close(conn);
        if (!got)
            continue;  // drop this client, keep serving

        LOG_DEBUG("[IPC] line: %s", line.c_str());
        serving = on_line ? on_line(line) : line != "QUIT";
    }

    close(fd);
    unlink(sock_path.c_str());
    return ok;
}

bool send_line(const std::string &sock_path, const std::string &line)
{
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("[IPC] refusing to send an empty line");
        return false;
    }
    sockaddr_un addr;
    socklen_t   len = 0;
    if (!fill_addr(sock_path, addr, len))
        return false;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("[IPC] socket() failed: %s", std::strerror(errno));
        return false;
    }
    set_cloexec(fd);

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), len) == -1)
    {
        fail_close(fd, "connect()");
        return false;
    }

    LOG_DEBUG("[IPC] sending: %s", line.c_str());
    size_t sent = 0;
    while (sent < line.size())
    {
        ssize_t n = send(fd, line.data() + sent, line.size() - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        fail_close(fd, "send()");
        return false;
    }

    close(fd);
    return true;
}

std::string expand_user(const std::string &p)
{
    // only a leading "~" or "~/"; "~user" is left alone
    if (p.empty() || p[0] != '~' || (p.size() > 1 && p[1] != '/'))
        return p;
    const char *home = std::getenv("HOME");
    if (!home || !*home)
        return p;
    return std::string(home) + p.substr(1);
}

}  // namespace ipc
