// tests/test_env.cpp
#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

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

TEST(Env_Adapter, DefaultAndOverride)
{
    EnvGuard g("BTCTL_ADAPTER");
    g.unset();
    EXPECT_EQ(constants::adapter_name(), "hci0");

    g.set("hci1");
    EXPECT_EQ(constants::adapter_name(), "hci1");

    g.set("");
    EXPECT_EQ(constants::adapter_name(), "hci0");
}

TEST(Env_ScanDuration, ValidValueUsed)
{
    EnvGuard g("BTCTL_SCAN_DURATION");
    g.unset();
    EXPECT_EQ(constants::default_scan_duration(), constants::SCAN_DURATION_DEFAULT);

    g.set("12");
    EXPECT_EQ(constants::default_scan_duration(), 12);
    g.set("60");
    EXPECT_EQ(constants::default_scan_duration(), 60);
}

TEST(Env_ScanDuration, InvalidValueIgnoredWithWarning)
{
    EnvGuard g("BTCTL_SCAN_DURATION");
    btctl::set_log_level(btctl::Level::Warning);

    for (const char *bad : {"0", "61", "abc", "5s"})
    {
        g.set(bad);
        testing::internal::CaptureStderr();
        int         got = constants::default_scan_duration();
        std::string log = testing::internal::GetCapturedStderr();

        EXPECT_EQ(got, constants::SCAN_DURATION_DEFAULT) << bad;
        EXPECT_NE(log.find("BTCTL_SCAN_DURATION"), std::string::npos) << bad;
    }
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace btctl;

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
    EXPECT_NE(out2.find("[ERROR]"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);
}

TEST(LogLevel, UnknownOrMissingNameMeansWarn)
{
    using namespace btctl;

    set_log_level_by_name("chatty");
    EXPECT_EQ(global_level(), Level::Warning);

    set_log_level_by_name("info");
    EXPECT_EQ(global_level(), Level::Info);

    set_log_level_by_name(nullptr);
    EXPECT_EQ(global_level(), Level::Warning);
}
