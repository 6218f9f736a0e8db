#include <gtest/gtest.h>

#include "Core/Warden/PolicyBuilder.hpp"
#include "Core/Warden/PolicyInput.hpp"
#include "Fakes.hpp"

#include <algorithm>

namespace {

std::vector<std::string> Described(const RuleSet &rules) {
    std::vector<std::string> out;
    for (const Rule &r : rules) out.push_back(Describe(r));
    return out;
}

Policy MakePolicy(const std::string &whitelist, const std::string &allowlist, bool kill_switch) {
    Policy p;
    p.bypass_entries = PolicyInput::ParseList(whitelist);
    p.api_allowlist = PolicyInput::ParseList(allowlist);
    p.kill_switch = kill_switch;
    p.outbound_iface = "eth0";
    return p;
}

class PolicyBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        resolver.answers["example.com"] = {{IpFamily::V4, "93.184.216.34"}};
        resolver.answers["dual.example.net"] = {{IpFamily::V4, "198.51.100.10"}, {IpFamily::V6, "2001:db8::10"}};
    }

    FakeResolver resolver;
    PolicyBuilder builder{resolver};
};

} // namespace

TEST_F(PolicyBuilderTest, BypassAllowlistAndKillSwitchInOrder) {
    const auto res = builder.Build(MakePolicy("example.com", "203.0.113.5", true));

    const std::vector<std::string> v4 = Described(RulesForFamily(res.rules, IpFamily::V4));
    const std::vector<std::string> expected = {
            "ACCEPT eth0->93.184.216.34",
            "ACCEPT *->203.0.113.5",
            "DROP eth0->*",
    };
    EXPECT_EQ(expected, v4);
    EXPECT_TRUE(res.warnings.empty());

    // IPv6 still gets the kill switch even with no IPv6 destinations
    const std::vector<std::string> v6 = Described(RulesForFamily(res.rules, IpFamily::V6));
    ASSERT_EQ(1u, v6.size());
    EXPECT_EQ("DROP eth0->*", v6[0]);
}

TEST_F(PolicyBuilderTest, KillSwitchOffEmitsNoDrop) {
    const auto res = builder.Build(MakePolicy("example.com", "203.0.113.5", false));
    for (const Rule &r : res.rules) {
        EXPECT_EQ(RuleAction::Accept, r.action) << Describe(r);
    }
    const auto v4 = Described(RulesForFamily(res.rules, IpFamily::V4));
    EXPECT_NE(v4.end(), std::find(v4.begin(), v4.end(), "ACCEPT *->203.0.113.5"));
}

TEST_F(PolicyBuilderTest, AllowlistPresentWithKillSwitchOn) {
    const auto res = builder.Build(MakePolicy("", "203.0.113.5;dual.example.net", true));
    const auto all = Described(res.rules);
    EXPECT_NE(all.end(), std::find(all.begin(), all.end(), "ACCEPT *->203.0.113.5"));
    EXPECT_NE(all.end(), std::find(all.begin(), all.end(), "ACCEPT *->198.51.100.10"));
    EXPECT_NE(all.end(), std::find(all.begin(), all.end(), "ACCEPT *->2001:db8::10"));
}

TEST_F(PolicyBuilderTest, DropIsLastRuleOfEachFamily) {
    const auto res = builder.Build(MakePolicy("example.com;dual.example.net;10.0.0.0/8;2001:db8:1::/48",
                                              "203.0.113.5", true));
    for (IpFamily family : {IpFamily::V4, IpFamily::V6}) {
        const RuleSet rules = RulesForFamily(res.rules, family);
        ASSERT_FALSE(rules.empty());
        EXPECT_EQ(RuleAction::Drop, rules.back().action);
        EXPECT_FALSE(rules.back().match.dest.has_value());
        for (std::size_t i = 0; i + 1 < rules.size(); ++i) {
            EXPECT_EQ(RuleAction::Accept, rules[i].action) << Describe(rules[i]);
        }
    }
}

TEST_F(PolicyBuilderTest, BypassRulesFollowDeclarationOrder) {
    const auto res = builder.Build(MakePolicy("10.0.0.0/8;example.com;172.16.0.0/12", "", false));
    const std::vector<std::string> expected = {
            "ACCEPT eth0->10.0.0.0/8",
            "ACCEPT eth0->93.184.216.34",
            "ACCEPT eth0->172.16.0.0/12",
    };
    EXPECT_EQ(expected, Described(RulesForFamily(res.rules, IpFamily::V4)));
}

TEST_F(PolicyBuilderTest, UnresolvableEntryIsOmittedWithWarning) {
    const auto res = builder.Build(MakePolicy("nx.invalid", "", false));
    EXPECT_TRUE(res.rules.empty());
    ASSERT_EQ(1u, res.warnings.size());
    EXPECT_NE(std::string::npos, res.warnings[0].find("nx.invalid"));
}

TEST_F(PolicyBuilderTest, UnresolvableEntryDoesNotAffectOthers) {
    const auto res = builder.Build(MakePolicy("nx.invalid;example.com", "", true));
    const std::vector<std::string> expected = {"ACCEPT eth0->93.184.216.34", "DROP eth0->*"};
    EXPECT_EQ(expected, Described(RulesForFamily(res.rules, IpFamily::V4)));
    EXPECT_EQ(1u, res.warnings.size());
}

TEST_F(PolicyBuilderTest, ResolvesEveryEntryEachBuild) {
    const Policy p = MakePolicy("example.com", "dual.example.net", true);
    builder.Build(p);
    resolver.answers["example.com"] = {{IpFamily::V4, "93.184.216.35"}};
    const auto res = builder.Build(p);
    EXPECT_EQ(4u, resolver.asked.size());
    EXPECT_EQ("ACCEPT eth0->93.184.216.35", Describe(RulesForFamily(res.rules, IpFamily::V4)[0]));
}

TEST(RuleDescribe, Format) {
    EXPECT_EQ("ACCEPT eth0->93.184.216.34", Describe(Rule{IpFamily::V4, RuleAction::Accept, {"eth0", "93.184.216.34"}}));
    EXPECT_EQ("DROP eth0->*", Describe(Rule{IpFamily::V6, RuleAction::Drop, {"eth0", std::nullopt}}));
    EXPECT_EQ("ACCEPT *->203.0.113.5", Describe(Rule{IpFamily::V4, RuleAction::Accept, {std::nullopt, "203.0.113.5"}}));
    EXPECT_STREQ("RECONNECTING", ToString(ConnectionState::Reconnecting));
}
