#pragma once

/**
 * @file Types.hpp
 * @brief Модель данных: записи обхода, политика, правила, состояние соединения.
 */

#include <optional>
#include <set>
#include <string>
#include <vector>

enum class IpFamily
{
    V4,
    V6
};

enum class RuleAction
{
    Accept,
    Drop
};

/**
 * @brief Запись обхода туннеля: имя хоста или IP/CIDR-литерал.
 * Хранится уже нормализованной (без схемы и пути).
 */
struct BypassEntry
{
    std::string raw;

    bool operator==(const BypassEntry &o) const { return raw == o.raw; }
};

/**
 * @brief Конкретный адрес назначения правила ("93.184.216.34", "10.0.0.0/8", "2001:db8::1").
 */
struct Destination
{
    IpFamily    family = IpFamily::V4;
    std::string text;

    bool operator==(const Destination &o) const { return family == o.family && text == o.text; }
    bool operator<(const Destination &o) const
    {
        if (family != o.family) return family < o.family;
        return text < o.text;
    }
};

struct ResolvedTarget
{
    BypassEntry           entry;
    std::set<Destination> addresses;
};

/**
 * @brief Декларативная политика обхода и kill switch.
 */
struct Policy
{
    std::vector<BypassEntry> bypass_entries;  ///< В порядке объявления.
    std::vector<BypassEntry> api_allowlist;   ///< Control-plane адреса, всегда разрешены.
    bool                     kill_switch    = true;
    std::string              outbound_iface = "eth0";
};

struct RuleMatch
{
    std::optional<std::string> iface;  ///< oifname; nullopt - любой интерфейс.
    std::optional<std::string> dest;   ///< daddr; nullopt - любой адрес.

    bool operator==(const RuleMatch &o) const { return iface == o.iface && dest == o.dest; }
};

struct Rule
{
    IpFamily   family = IpFamily::V4;
    RuleAction action = RuleAction::Accept;
    RuleMatch  match;

    bool operator==(const Rule &o) const
    {
        return family == o.family && action == o.action && match == o.match;
    }
};

// Порядок значим: bypass -> allowlist -> kill switch.
using RuleSet = std::vector<Rule>;

enum class StatusClass
{
    None          = 0,
    Informational = 1,
    Success       = 2,
    Redirect      = 3,
    ClientError   = 4,
    ServerError   = 5
};

struct ProbeResult
{
    std::string endpoint;
    bool        succeeded    = false;
    StatusClass status_class = StatusClass::None;
};

enum class ConnectionState
{
    Init,
    Connecting,
    Connected,
    Degraded,
    Reconnecting,
    Failed
};

const char *ToString(IpFamily family);
const char *ToString(RuleAction action);
const char *ToString(ConnectionState state);

// "ACCEPT eth0->93.184.216.34", "DROP eth0->*", "ACCEPT *->203.0.113.5"
std::string Describe(const Rule &rule);

// Правила одного семейства с сохранением порядка.
RuleSet RulesForFamily(const RuleSet &rules, IpFamily family);
