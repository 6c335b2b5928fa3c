#include "app/hooks.hpp"

#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>

#include "util/log.hpp"

extern char **environ;

namespace app
{

namespace
{
void reap(pid_t pid, const std::string &exe, const std::string &arg)
{
    int status = 0;
    while (waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            LOG_ERROR("[HOOK] waitpid(%d) failed: %s", (int)pid, std::strerror(errno));
            return;
        }
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0)
        LOG_DEBUG("[HOOK] %s %s done", exe.c_str(), arg.c_str());
    else if (WIFEXITED(status))
        LOG_WARN("[HOOK] %s %s exited with %d", exe.c_str(), arg.c_str(), WEXITSTATUS(status));
    else
        LOG_WARN("[HOOK] %s %s terminated abnormally", exe.c_str(), arg.c_str());
}
}  // namespace

// ======================================================================
// Function: run_hook
// - In: executable, single argument
// - Out: true when the child was spawned
// - Note: never waits for the child; a detached reaper collects it and logs the exit status
// ======================================================================
bool run_hook(const std::string &exe, const char *arg)
{
    if (exe.empty())
        return false;

    std::string a0 = exe;
    std::string a1 = arg ? arg : "";
    char       *argv[] = {a0.data(), a1.data(), nullptr};

    pid_t pid = 0;
    int   rc  = posix_spawnp(&pid, exe.c_str(), nullptr, nullptr, argv, environ);
    if (rc != 0)
    {
        LOG_ERROR("[HOOK] spawn %s failed: %s", exe.c_str(), std::strerror(rc));
        return false;
    }
    LOG_DEBUG("[HOOK] %s %s started (pid %d)", exe.c_str(), a1.c_str(), (int)pid);

    std::thread([pid, exe, a1]() { reap(pid, exe, a1); }).detach();
    return true;
}

bool HookMediaSource::execute(media::MediaCommand cmd)
{
    const char *name = media::media_command_name(cmd);
    if (exe_.empty())
    {
        LOG_WARN("[HOOK] media command '%s' dropped: PHONELINK_MEDIA_HOOK not set", name);
        return false;
    }
    LOG_INFO("[HOOK] media %s", name);
    return run_hook(exe_, name);
}

bool HookTelephony::supports(call::CallCommand cmd) const
{
    if (exe_.empty())
        return false;
    return cmd == call::CallCommand::Accept || cmd == call::CallCommand::Reject ||
           cmd == call::CallCommand::End;
}

bool HookTelephony::execute(call::CallCommand cmd)
{
    const char *name = call::call_command_name(cmd);
    if (!supports(cmd))
    {
        LOG_WARN("[HOOK] call command '%s' not supported", name);
        return false;
    }
    LOG_INFO("[HOOK] call %s", name);
    return run_hook(exe_, name);
}

}  // namespace app
