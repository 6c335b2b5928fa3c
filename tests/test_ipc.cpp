#include <atomic>
#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

namespace
{
void wait_for_socket(const std::string &sock)
{
    for (int i = 0; i < 200; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            return;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}
}  // namespace

TEST(IPC, TestExpandUser)
{
    const char *path      = std::getenv("HOME");
    std::string saved     = path ? path : "";
    const char *test_home = "/tmp/ut-home";
    setenv("HOME", test_home, 1);

    EXPECT_EQ(ipc::expand_user("~"), test_home);
    EXPECT_EQ(ipc::expand_user("~/x/y"), std::string(test_home) + "/x/y");
    EXPECT_EQ(ipc::expand_user("/abs/path"), "/abs/path");
    EXPECT_EQ(ipc::expand_user("relative/~/path"), "relative/~/path");

    if (path)
        setenv("HOME", saved.c_str(), 1);
    else
        unsetenv("HOME");
}

TEST(IPC, TestExpandUserNoHomeEnv)
{
    const char *path  = std::getenv("HOME");
    std::string saved = path ? path : "";
    unsetenv("HOME");
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/x"), "~/x");
    if (path)
        setenv("HOME", saved.c_str(), 1);
}

TEST(IPC, TestStartServerQuitWithoutHandler)
{
    std::string sock = "/tmp/phonelink-ipc-ut-" + std::to_string(getpid()) + ".sock";

    // no handler: runs until QUIT
    std::thread th([&] { EXPECT_TRUE(ipc::start_server(sock, nullptr)); });
    wait_for_socket(sock);
    ASSERT_TRUE(ipc::send_line(sock, "QUIT\n"));
    th.join();
    // server should unlink the socket
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(IPC, TestHandlerSeesLinesAndStops)
{
    std::string sock = "/tmp/phonelink-ipc-ut2-" + std::to_string(getpid()) + ".sock";

    std::mutex               mu;
    std::vector<std::string> seen;
    ipc::LineHandler         handler = [&](const std::string &line) {
        std::lock_guard<std::mutex> lk(mu);
        seen.push_back(line);
        return line != "STOP";
    };

    std::thread th([&] { EXPECT_TRUE(ipc::start_server(sock, handler)); });
    wait_for_socket(sock);
    ASSERT_TRUE(ipc::send_line(sock, "STATUS\r\n"));
    ASSERT_TRUE(ipc::send_line(sock, "MEDIA\ttitle=Song A\n"));
    ASSERT_TRUE(ipc::send_line(sock, "STOP\n"));
    th.join();

    std::lock_guard<std::mutex> lk(mu);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], "STATUS");
    EXPECT_EQ(seen[1], "MEDIA\ttitle=Song A");
    EXPECT_EQ(seen[2], "STOP");
}

TEST(IPC, TestSendLineNoServer)
{
    std::string sock = "/tmp/phonelink-ipc-none-" + std::to_string(getpid()) + ".sock";
    ::unlink(sock.c_str());
    EXPECT_FALSE(ipc::send_line(sock, "STATUS\n"));
}
