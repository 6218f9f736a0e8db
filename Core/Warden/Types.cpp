#include "Types.hpp"

const char *ToString(IpFamily family)
{
    return family == IpFamily::V4 ? "IPv4" : "IPv6";
}

const char *ToString(RuleAction action)
{
    return action == RuleAction::Accept ? "ACCEPT" : "DROP";
}

const char *ToString(ConnectionState state)
{
    switch (state)
    {
        case ConnectionState::Init:         return "INIT";
        case ConnectionState::Connecting:   return "CONNECTING";
        case ConnectionState::Connected:    return "CONNECTED";
        case ConnectionState::Degraded:     return "DEGRADED";
        case ConnectionState::Reconnecting: return "RECONNECTING";
        case ConnectionState::Failed:       return "FAILED";
    }
    return "?";
}

std::string Describe(const Rule &rule)
{
    std::string s = ToString(rule.action);
    s += ' ';
    s += rule.match.iface ? *rule.match.iface : "*";
    s += "->";
    s += rule.match.dest ? *rule.match.dest : "*";
    return s;
}

RuleSet RulesForFamily(const RuleSet &rules, IpFamily family)
{
    RuleSet out;
    for (const Rule &r : rules)
    {
        if (r.family == family) out.push_back(r);
    }
    return out;
}
