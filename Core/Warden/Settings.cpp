#include "Settings.hpp"
#include "PolicyInput.hpp"
#include "Core/Config.hpp"
#include "Core/Logger.hpp"

#include <boost/json.hpp>

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace
{
    std::vector<std::string> SplitWords(const std::string &s)
    {
        std::vector<std::string> out;
        std::istringstream in(s);
        std::string w;
        while (in >> w) out.push_back(w);
        return out;
    }

    // строка "a;b" или массив строк
    std::vector<std::string> StringList(const boost::json::value &v, const char *key, const char *delims)
    {
        std::vector<std::string> out;
        if (v.is_string())
        {
            return PolicyInput::Split(std::string(v.as_string().c_str()), delims);
        }
        if (!v.is_array())
        {
            throw std::runtime_error(std::string("'") + key + "' must be a string or an array of strings");
        }
        for (const boost::json::value &x : v.as_array())
        {
            if (!x.is_string())
                throw std::runtime_error(std::string("'") + key + "' array must contain strings");
            out.emplace_back(x.as_string().c_str());
        }
        return out;
    }

    std::chrono::seconds Seconds(int v) { return std::chrono::seconds(v); }
}

namespace SettingsLoader
{
    Settings Load(const std::string &json_text)
    {
        Settings s;

        if (json_text.find_first_not_of(" \t\r\n") != std::string::npos)
        {
            boost::json::value jv = boost::json::parse(json_text);
            if (!jv.is_object())
                throw std::runtime_error("config root must be an object");
            const boost::json::object &o = jv.as_object();

            if (auto v = Config::OptionalString(o, "whitelist"))     s.whitelist     = *v;
            if (auto v = Config::OptionalString(o, "api_allowlist")) s.api_allowlist = *v;
            if (auto v = Config::OptionalBool(o,   "killswitch"))    s.kill_switch   = *v;
            if (auto v = Config::OptionalString(o, "interface"))     s.iface         = *v;

            if (const boost::json::value *v = o.if_contains("check_connection_url"))
                s.probe_urls = StringList(*v, "check_connection_url", ";");
            if (auto v = Config::OptionalInt(o, "check_connection_attempts"))         s.attempts         = *v;
            if (auto v = Config::OptionalInt(o, "check_connection_attempt_interval")) s.attempt_interval = Seconds(*v);
            if (auto v = Config::OptionalInt(o, "check_connection_interval"))         s.check_interval   = Seconds(*v);
            if (auto v = Config::OptionalInt(o, "probe_timeout"))                     s.probe_timeout    = Seconds(*v);

            if (auto v = Config::OptionalString(o, "auth_file"))      s.auth_file      = *v;
            if (auto v = Config::OptionalString(o, "ovpn_file"))      s.ovpn_file      = *v;
            if (const boost::json::value *v = o.if_contains("config_command"))
            {
                s.config_command = v->is_string() ? SplitWords(std::string(v->as_string().c_str()))
                                                  : StringList(*v, "config_command", "");
            }
            if (auto v = Config::OptionalString(o, "tunnel_service")) s.tunnel_service = *v;
            if (auto v = Config::OptionalString(o, "service_dir"))    s.service_dir    = *v;
            if (auto v = Config::OptionalString(o, "s6_svc"))         s.s6_svc         = *v;
            if (auto v = Config::OptionalString(o, "tunnel_binary"))  s.tunnel_binary  = *v;
            if (auto v = Config::OptionalString(o, "openvpn_opts"))   s.openvpn_opts   = *v;

            if (auto v = Config::OptionalString(o, "table"))          s.table          = *v;
            if (auto v = Config::OptionalBool(o,   "revert_on_exit")) s.revert_on_exit = *v;

            if (auto v = Config::OptionalString(o, "log_dir"))        s.log_dir        = *v;
            if (auto v = Config::OptionalString(o, "log_level"))      s.log_level      = *v;
        }

        ApplyEnvironment(s);
        Validate(s);
        return s;
    }

    void ApplyEnvironment(Settings &s)
    {
        using Config::Env;

        if (auto v = Env("WHITELIST"))         s.whitelist     = *v;
        if (auto v = Env("API_ALLOWLIST"))     s.api_allowlist = *v;
        if (auto v = Env("KILLSWITCH"))        s.kill_switch   = Config::ParseBool(*v);
        if (auto v = Env("NETWORK_INTERFACE")) s.iface         = *v;

        if (auto v = Env("CHECK_CONNECTION_URL"))
            s.probe_urls = PolicyInput::Split(*v, ";");
        if (auto v = Env("CHECK_CONNECTION_ATTEMPTS"))
            s.attempts = Config::ParseInt(*v, 1, 1000);
        if (auto v = Env("CHECK_CONNECTION_ATTEMPT_INTERVAL"))
            s.attempt_interval = Seconds(Config::ParseInt(*v, 0, 86400));
        if (auto v = Env("CHECK_CONNECTION_INTERVAL"))
            s.check_interval = Seconds(Config::ParseInt(*v, 1, 86400));
        if (auto v = Env("CHECK_CONNECTION_TIMEOUT"))
            s.probe_timeout = Seconds(Config::ParseInt(*v, 1, 300));

        if (auto v = Env("CONFIG_COMMAND")) s.config_command = SplitWords(*v);
        if (auto v = Env("OPENVPN_OPTS"))   s.openvpn_opts   = *v;

        // DEBUG=trace* - как в скриптах init
        if (auto v = Env("DEBUG"))
        {
            std::string d = *v;
            for (char &c : d) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (d.rfind("trace", 0) == 0) s.log_level = "trace";
        }
    }

    void Validate(const Settings &s)
    {
        if (s.iface.empty())
            throw std::invalid_argument("'interface' cannot be empty");
        if (s.probe_urls.empty())
            throw std::invalid_argument("at least one check_connection_url is required");
        if (s.attempts < 1)
            throw std::invalid_argument("'check_connection_attempts' must be >= 1");
        if (s.attempt_interval.count() < 0)
            throw std::invalid_argument("'check_connection_attempt_interval' must be >= 0");
        if (s.check_interval.count() < 1)
            throw std::invalid_argument("'check_connection_interval' must be >= 1");
        if (s.probe_timeout.count() < 1)
            throw std::invalid_argument("'probe_timeout' must be >= 1");
        if (s.config_command.empty())
            throw std::invalid_argument("'config_command' cannot be empty");
        if (s.auth_file.empty() || s.ovpn_file.empty())
            throw std::invalid_argument("'auth_file' and 'ovpn_file' are required");
        if (s.tunnel_service.empty())
            throw std::invalid_argument("'tunnel_service' cannot be empty");
        if (s.table.empty())
            throw std::invalid_argument("'table' cannot be empty");

        Logger::Severity sev{};
        if (!Logger::ParseSeverity(s.log_level, sev))
            throw std::invalid_argument("unknown log_level '" + s.log_level + "'");
    }

    Policy MakePolicy(const Settings &s)
    {
        Policy p;
        p.bypass_entries = PolicyInput::ParseList(s.whitelist);
        p.api_allowlist  = PolicyInput::ParseList(s.api_allowlist);
        p.kill_switch    = s.kill_switch;
        p.outbound_iface = s.iface;
        return p;
    }
}
