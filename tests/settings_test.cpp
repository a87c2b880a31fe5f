#include <sstream>

#include <gtest/gtest.h>

#include "settings.h"

using namespace aranet;
using namespace std::chrono_literals;

TEST(SettingsTest, ParseLine) {
    std::string key;
    std::string value;
    ASSERT_TRUE(parse_settings_line("  scan_timeout =  15 ", key, value));
    EXPECT_EQ(key, "scan_timeout");
    EXPECT_EQ(value, "15");

    ASSERT_TRUE(parse_settings_line("verbose=\"yes\"", key, value));
    EXPECT_EQ(value, "yes");

    EXPECT_FALSE(parse_settings_line("scan_timeout", key, value));
    EXPECT_FALSE(parse_settings_line("= 3", key, value));
    EXPECT_FALSE(parse_settings_line("grace_timeout =", key, value));
}

TEST(SettingsTest, ApplyKnownKeys) {
    Settings s;
    EXPECT_TRUE(apply_setting(s, "SCAN_TIMEOUT", "20"));
    EXPECT_TRUE(apply_setting(s, "absolute_timeout", "45"));
    EXPECT_TRUE(apply_setting(s, "verbose", "True"));
    EXPECT_EQ(s.scan_timeout, 20s);
    EXPECT_EQ(s.absolute_timeout, 45s);
    EXPECT_TRUE(s.verbose);

    EXPECT_FALSE(apply_setting(s, "scan_timeout", "-1"));
    EXPECT_FALSE(apply_setting(s, "scan_timeout", "ten"));
    EXPECT_FALSE(apply_setting(s, "verbose", "maybe"));
    EXPECT_FALSE(apply_setting(s, "colour", "red"));
    EXPECT_EQ(s.scan_timeout, 20s);
}

TEST(SettingsTest, LoadSkipsCommentsAndBadLines) {
    std::istringstream in(
        "# aranetctl settings\n"
        "// timeouts in seconds\n"
        "; legacy comment\n"
        "\n"
        "device_scan_timeout = 8\n"
        "ready_timeout = 2\n"
        "grace_timeout = 4\n"
        "monitor_margin = 5\n"
        "not a setting\n"
        "unknown_key = 1\n"
        "verbose = off\n");
    Settings s;
    s.verbose = true;

    EXPECT_EQ(load_settings(in, s), 5u);
    EXPECT_EQ(s.device_scan_timeout, 8s);
    EXPECT_EQ(s.ready_timeout, 2s);
    EXPECT_EQ(s.grace_timeout, 4s);
    EXPECT_EQ(s.monitor_margin, 5s);
    EXPECT_FALSE(s.verbose);
    EXPECT_EQ(s.scan_timeout, 10s);
}

TEST(SettingsTest, Defaults) {
    Settings s;
    SessionOptions session = s.session_options();
    EXPECT_EQ(session.ready_timeout, 5s);
    EXPECT_EQ(session.grace_timeout, 5s);
    EXPECT_EQ(session.absolute_timeout, 30s);
    EXPECT_EQ(s.monitor_options().margin, 3s);
}

TEST(SettingsTest, MissingFile) {
    Settings s;
    EXPECT_FALSE(load_settings_file("/nonexistent/aranetctl.settings", s));
    EXPECT_EQ(s.scan_timeout, 10s);
    EXPECT_TRUE(resolve_config_path("no-such-aranetctl.settings").empty());
}

TEST(SettingsTest, TimeoutOverrideFollowsCommand) {
    Settings s;
    EXPECT_TRUE(s.apply_timeout_override("scan", 25s));
    EXPECT_EQ(s.scan_timeout, 25s);
    EXPECT_EQ(s.device_scan_timeout, 10s);

    Settings r;
    EXPECT_TRUE(r.apply_timeout_override("read", 4s));
    EXPECT_EQ(r.device_scan_timeout, 4s);
    EXPECT_EQ(r.scan_timeout, 10s);

    Settings m;
    EXPECT_TRUE(m.apply_timeout_override("monitor", 7s));
    EXPECT_EQ(m.device_scan_timeout, 7s);

    Settings x;
    EXPECT_FALSE(x.apply_timeout_override("status", 7s));
    EXPECT_EQ(x.scan_timeout, 10s);
    EXPECT_EQ(x.device_scan_timeout, 10s);
}
