// tests/test_cli.cpp
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"

using namespace std::chrono_literals;

namespace test_cli
{
std::mutex               g_mu;
std::vector<std::string> g_lines;

static bool on_line_cb(const std::string &line)
{
    std::lock_guard<std::mutex> lockguard(g_mu);
    g_lines.push_back(line);
    return line != "QUIT";
}

static std::string temp_sock_path(const char *tag)
{
    const char *tmp  = std::getenv("TMPDIR");
    std::string base = (tmp && *tmp) ? tmp : "/tmp";
    return base + "/phonelink-cli-" + tag + "-" + std::to_string(::getpid()) + ".sock";
}

static int run_cli(const std::string &sock, const std::string &args)
{
    // ctest runs from the build directory; binaries live in ./bin
    std::string cmd = "./bin/phonelinkctl --sock " + sock + " " + args + " 2>/dev/null";
    int         rc  = std::system(cmd.c_str());
    if (rc == -1)
        return -1;
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}
}  // namespace test_cli

TEST(CLI, TestCliFunctionality)
{
    test_cli::g_lines.clear();
    const auto sock = test_cli::temp_sock_path("ok");

    std::atomic<bool> server_done{false};
    std::thread       th([&] {
        (void)ipc::start_server(sock, test_cli::on_line_cb);
        server_done.store(true);
    });

    // Wait for server to bind the socket
    for (int i = 0; i < 100; ++i)
    {
        if (access(sock.c_str(), F_OK) == 0)
            break;
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(access(sock.c_str(), F_OK) == 0) << "socket not created: " << sock;

    // Exercise CLI argument parsing + IPC
    EXPECT_EQ(test_cli::run_cli(sock, "connect aa:bb:cc:dd:ee:ff"), 0);
    EXPECT_EQ(test_cli::run_cli(sock, "media \"title=Hello World\" playing=1 duration=180000"), 0);
    EXPECT_EQ(test_cli::run_cli(sock, "call ringing +15551234567"), 0);
    EXPECT_EQ(test_cli::run_cli(sock, "name Jane Doe"), 0);
    EXPECT_EQ(test_cli::run_cli(sock, "status"), 0);
    EXPECT_EQ(test_cli::run_cli(sock, "quit"), 0);

    th.join();
    ASSERT_TRUE(server_done.load());

    // Validate the lines the daemon saw
    {
        std::lock_guard<std::mutex> lockguard(test_cli::g_mu);
        ASSERT_EQ(test_cli::g_lines.size(), 6u);
        EXPECT_EQ(test_cli::g_lines[0], "CONNECT AA:BB:CC:DD:EE:FF");
        EXPECT_EQ(test_cli::g_lines[1], "MEDIA\ttitle=Hello World\tplaying=1\tduration=180000");
        EXPECT_EQ(test_cli::g_lines[2], "CALL\tRINGING\t+15551234567");
        EXPECT_EQ(test_cli::g_lines[3], "NAME\tJane Doe");
        EXPECT_EQ(test_cli::g_lines[4], "STATUS");
        EXPECT_EQ(test_cli::g_lines.back(), "QUIT");
    }

    // start_server should have cleaned up the socket file
    EXPECT_FALSE(access(sock.c_str(), F_OK) == 0);
}

TEST(CLI, TestCliRejectsBadArgumentsBeforeSending)
{
    // no server listening: bad arguments must fail with 2 before any connect attempt
    const auto sock = test_cli::temp_sock_path("bad");
    EXPECT_EQ(test_cli::run_cli(sock, "connect not-a-mac"), 2);
    EXPECT_EQ(test_cli::run_cli(sock, "call dialing"), 2);
    EXPECT_EQ(test_cli::run_cli(sock, "media volume=3"), 2);
    EXPECT_EQ(test_cli::run_cli(sock, "name"), 2);
    EXPECT_EQ(test_cli::run_cli(sock, "frobnicate"), 2);
}

TEST(CLI, TestCliReportsMissingDaemon)
{
    const auto sock = test_cli::temp_sock_path("none");
    ::unlink(sock.c_str());
    EXPECT_EQ(test_cli::run_cli(sock, "status"), 3);
}
