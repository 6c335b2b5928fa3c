// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>

#include "app/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("PHONELINK_CTL_SOCK");
    const std::string want = "/tmp/phonelink-test.sock";
    g.set(want);

    // should NOT log the default when env is set
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, want);
    EXPECT_TRUE(err.find("Control socket defaults to") == std::string::npos);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("PHONELINK_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "phonelink-home";
    std::filesystem::create_directories(tmp);
    g_home.set(tmp.string());

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    std::string want = (tmp / ".cache/phonelink/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("Control socket defaults to " + want), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace phonelink;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // SYSTEM is never filtered
    testing::internal::CaptureStderr();
    LOG_SYSTEM("system_always_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("system_always_visible"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("debug");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out4 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out4.find("debug_visible"), std::string::npos);
}

TEST(Config, DefaultsWithEmptyEnv)
{
    EnvGuard t("PHONELINK_TRANSPORT"), p("PHONELINK_PEER"), d("PHONELINK_CONNECT_DELAY_MS"),
        c("PHONELINK_COOLDOWN_MS"), n("PHONELINK_DEVICE_NAME"), s("PHONELINK_CTL_SOCK");
    t.unset();
    p.unset();
    d.unset();
    c.unset();
    n.unset();
    s.set("/tmp/phonelink-cfg.sock");

    app::Config cfg = app::load_config_from_env();
    EXPECT_EQ(cfg.transport, app::TransportKind::Loopback);
    EXPECT_EQ(cfg.adapter, "hci0");
    EXPECT_TRUE(cfg.peer.empty());
    EXPECT_EQ(cfg.device_name, "phonelink");
    EXPECT_EQ(cfg.connect_delay_ms, 100u);
    EXPECT_EQ(cfg.cooldown_ms, 800u);
    EXPECT_EQ(cfg.ctl_sock, "/tmp/phonelink-cfg.sock");
}

TEST(Config, ReadsValidValues)
{
    EnvGuard t("PHONELINK_TRANSPORT"), p("PHONELINK_PEER"), d("PHONELINK_CONNECT_DELAY_MS"),
        c("PHONELINK_COOLDOWN_MS"), n("PHONELINK_DEVICE_NAME");
    t.set("BlueZ");
    p.set("aa:bb:cc:dd:ee:ff");
    d.set("0");
    c.set("1500");
    n.set("kitchen-hub");

    app::Config cfg = app::load_config_from_env();
    EXPECT_EQ(cfg.transport, app::TransportKind::Bluez);
    EXPECT_STREQ(app::transport_name(cfg.transport), "bluez");
    EXPECT_EQ(cfg.peer, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(cfg.connect_delay_ms, 0u);
    EXPECT_EQ(cfg.cooldown_ms, 1500u);
    EXPECT_EQ(cfg.device_name, "kitchen-hub");
}

TEST(Config, InvalidValuesKeepDefaultsAndWarn)
{
    phonelink::set_log_level_by_name("debug");
    EnvGuard p("PHONELINK_PEER"), d("PHONELINK_CONNECT_DELAY_MS"), c("PHONELINK_COOLDOWN_MS");
    p.set("not-a-mac");
    d.set("-5");
    c.set("99999");

    testing::internal::CaptureStderr();
    app::Config cfg = app::load_config_from_env();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(cfg.peer.empty());
    EXPECT_EQ(cfg.connect_delay_ms, 100u);
    EXPECT_EQ(cfg.cooldown_ms, 800u);
    EXPECT_NE(err.find("Ignoring invalid PHONELINK_PEER"), std::string::npos);
    EXPECT_NE(err.find("Ignoring invalid PHONELINK_CONNECT_DELAY_MS='-5' (expect 0..5000)"),
              std::string::npos);
    EXPECT_NE(err.find("Ignoring invalid PHONELINK_COOLDOWN_MS='99999' (expect 0..10000)"),
              std::string::npos);
}
