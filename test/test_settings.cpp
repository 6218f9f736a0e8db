#include <gtest/gtest.h>

#include "Core/Config.hpp"
#include "Core/Warden/Settings.hpp"

#include <cstdlib>

namespace {

const char *const kEnvVars[] = {
        "WHITELIST", "API_ALLOWLIST", "KILLSWITCH", "NETWORK_INTERFACE",
        "CHECK_CONNECTION_URL", "CHECK_CONNECTION_ATTEMPTS", "CHECK_CONNECTION_ATTEMPT_INTERVAL",
        "CHECK_CONNECTION_INTERVAL", "CHECK_CONNECTION_TIMEOUT", "CONFIG_COMMAND", "OPENVPN_OPTS", "DEBUG",
};

class SettingsTest : public ::testing::Test {
protected:
    void SetUp() override { ClearEnv(); }
    void TearDown() override { ClearEnv(); }

    static void ClearEnv() {
        for (const char *name : kEnvVars) ::unsetenv(name);
    }
};

} // namespace

TEST_F(SettingsTest, DefaultsWithoutConfig) {
    const Settings s = SettingsLoader::Load("");
    EXPECT_EQ("", s.whitelist);
    EXPECT_EQ("api.nordvpn.com", s.api_allowlist);
    EXPECT_TRUE(s.kill_switch);
    EXPECT_EQ("eth0", s.iface);
    ASSERT_EQ(1u, s.probe_urls.size());
    EXPECT_EQ(5, s.attempts);
    EXPECT_EQ(std::chrono::seconds(10), s.attempt_interval);
    EXPECT_EQ(std::chrono::seconds(60), s.check_interval);
    EXPECT_EQ("nordvpnd", s.tunnel_service);
    EXPECT_FALSE(s.revert_on_exit);
}

TEST_F(SettingsTest, JsonKeys) {
    const Settings s = SettingsLoader::Load(R"({
        "whitelist": "example.com;10.0.0.0/8",
        "killswitch": false,
        "interface": "ens3",
        "check_connection_url": ["https://a.example/", "http://b.example/204"],
        "check_connection_attempts": 3,
        "check_connection_attempt_interval": 2,
        "config_command": "/usr/bin/createvpnconfig.sh --country de",
        "table": "vpn",
        "revert_on_exit": true,
        "log_level": "debug"
    })");
    EXPECT_EQ("example.com;10.0.0.0/8", s.whitelist);
    EXPECT_FALSE(s.kill_switch);
    EXPECT_EQ("ens3", s.iface);
    ASSERT_EQ(2u, s.probe_urls.size());
    EXPECT_EQ("http://b.example/204", s.probe_urls[1]);
    EXPECT_EQ(3, s.attempts);
    EXPECT_EQ(std::chrono::seconds(2), s.attempt_interval);
    const std::vector<std::string> cmd = {"/usr/bin/createvpnconfig.sh", "--country", "de"};
    EXPECT_EQ(cmd, s.config_command);
    EXPECT_EQ("vpn", s.table);
    EXPECT_TRUE(s.revert_on_exit);
    EXPECT_EQ("debug", s.log_level);
}

TEST_F(SettingsTest, EnvironmentOverridesJson) {
    ::setenv("KILLSWITCH", "off", 1);
    ::setenv("NETWORK_INTERFACE", "eth1", 1);
    ::setenv("CHECK_CONNECTION_URL", "https://x.example/;https://y.example/", 1);
    ::setenv("CHECK_CONNECTION_ATTEMPTS", "7", 1);
    ::setenv("DEBUG", "trace-all", 1);

    const Settings s = SettingsLoader::Load(R"({"killswitch": true, "interface": "ens3"})");
    EXPECT_FALSE(s.kill_switch);
    EXPECT_EQ("eth1", s.iface);
    ASSERT_EQ(2u, s.probe_urls.size());
    EXPECT_EQ("https://y.example/", s.probe_urls[1]);
    EXPECT_EQ(7, s.attempts);
    EXPECT_EQ("trace", s.log_level);
}

TEST_F(SettingsTest, EmptyEnvironmentValueIsIgnored) {
    ::setenv("NETWORK_INTERFACE", "", 1);
    EXPECT_EQ("eth0", SettingsLoader::Load("").iface);
}

TEST_F(SettingsTest, InvalidValuesAreRejected) {
    EXPECT_ANY_THROW(SettingsLoader::Load("{not json"));
    EXPECT_ANY_THROW(SettingsLoader::Load("[1, 2]"));
    EXPECT_THROW(SettingsLoader::Load(R"({"check_connection_attempts": 0})"), std::invalid_argument);
    EXPECT_THROW(SettingsLoader::Load(R"({"interface": ""})"), std::invalid_argument);
    EXPECT_THROW(SettingsLoader::Load(R"({"log_level": "loud"})"), std::invalid_argument);
    EXPECT_THROW(SettingsLoader::Load(R"({"killswitch": "yes"})"), std::runtime_error);

    ::setenv("CHECK_CONNECTION_ATTEMPTS", "many", 1);
    EXPECT_THROW(SettingsLoader::Load(""), std::invalid_argument);
}

TEST_F(SettingsTest, MakePolicyParsesRawLists) {
    ::setenv("WHITELIST", "https://Example.com/x;10.0.0.0/8;example.com", 1);
    ::setenv("API_ALLOWLIST", "api.nordvpn.com,203.0.113.5", 1);
    const Policy p = SettingsLoader::MakePolicy(SettingsLoader::Load(""));
    ASSERT_EQ(2u, p.bypass_entries.size());
    EXPECT_EQ("example.com", p.bypass_entries[0].raw);
    EXPECT_EQ("10.0.0.0/8", p.bypass_entries[1].raw);
    ASSERT_EQ(2u, p.api_allowlist.size());
    EXPECT_TRUE(p.kill_switch);
    EXPECT_EQ("eth0", p.outbound_iface);
}

TEST(ConfigParse, Bool) {
    EXPECT_TRUE(Config::ParseBool("1"));
    EXPECT_TRUE(Config::ParseBool("Yes"));
    EXPECT_TRUE(Config::ParseBool("ON"));
    EXPECT_FALSE(Config::ParseBool("false"));
    EXPECT_FALSE(Config::ParseBool("0"));
    EXPECT_THROW(Config::ParseBool("maybe"), std::invalid_argument);
}

TEST(ConfigParse, IntRange) {
    EXPECT_EQ(42, Config::ParseInt("42", 1, 100));
    EXPECT_THROW(Config::ParseInt("0", 1, 100), std::invalid_argument);
    EXPECT_THROW(Config::ParseInt("12abc", 1, 100), std::invalid_argument);
    EXPECT_THROW(Config::ParseInt("", 1, 100), std::invalid_argument);
}

TEST(ConfigFields, RequireAndOptional) {
    const boost::json::object o = boost::json::parse(R"({"name": "x", "n": 5, "b": true})").as_object();
    EXPECT_EQ("x", Config::RequireString(o, "name"));
    EXPECT_EQ(5, Config::RequireInt(o, "n"));
    EXPECT_TRUE(Config::RequireBool(o, "b"));
    EXPECT_THROW(Config::RequireString(o, "missing"), std::runtime_error);
    EXPECT_THROW(Config::RequireInt(o, "name"), std::runtime_error);
    EXPECT_FALSE(Config::OptionalInt(o, "missing").has_value());
}
