#include "Core/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace
{
    const boost::json::value &RequireField(const boost::json::object &o, const char *key)
    {
        const boost::json::value *v = o.if_contains(key);
        if (!v)
        {
            throw std::runtime_error(std::string("missing required field '") + key + "'");
        }
        return *v;
    }

    std::string Lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

namespace Config
{
    std::string RequireString(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = RequireField(o, key);
        if (!v.is_string())
        {
            throw std::runtime_error(std::string("field '") + key + "' must be a string");
        }
        return std::string(v.as_string().c_str());
    }

    int RequireInt(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = RequireField(o, key);
        if (v.is_int64())
        {
            return static_cast<int>(v.as_int64());
        }
        if (v.is_uint64())
        {
            return static_cast<int>(v.as_uint64());
        }
        throw std::runtime_error(std::string("field '") + key + "' must be an integer");
    }

    bool RequireBool(const boost::json::object &o, const char *key)
    {
        const boost::json::value &v = RequireField(o, key);
        if (!v.is_bool())
        {
            throw std::runtime_error(std::string("field '") + key + "' must be a boolean");
        }
        return v.as_bool();
    }

    std::optional<std::string> OptionalString(const boost::json::object &o, const char *key)
    {
        if (!o.if_contains(key)) return std::nullopt;
        return RequireString(o, key);
    }

    std::optional<int> OptionalInt(const boost::json::object &o, const char *key)
    {
        if (!o.if_contains(key)) return std::nullopt;
        return RequireInt(o, key);
    }

    std::optional<bool> OptionalBool(const boost::json::object &o, const char *key)
    {
        if (!o.if_contains(key)) return std::nullopt;
        return RequireBool(o, key);
    }

    std::optional<std::string> Env(const char *name)
    {
        const char *v = std::getenv(name);
        if (!v || *v == '\0') return std::nullopt;
        return std::string(v);
    }

    bool ParseBool(const std::string &text)
    {
        const std::string t = Lower(text);
        if (t == "1" || t == "true"  || t == "yes" || t == "on")  return true;
        if (t == "0" || t == "false" || t == "no"  || t == "off") return false;
        throw std::invalid_argument("not a boolean: '" + text + "'");
    }

    int ParseInt(const std::string &text, int min_v, int max_v)
    {
        std::size_t pos = 0;
        long v = 0;
        try
        {
            v = std::stol(text, &pos, 10);
        }
        catch (const std::exception &)
        {
            throw std::invalid_argument("not an integer: '" + text + "'");
        }
        if (pos != text.size())
        {
            throw std::invalid_argument("not an integer: '" + text + "'");
        }
        if (v < min_v || v > max_v)
        {
            throw std::invalid_argument("value " + text + " out of range [" +
                                        std::to_string(min_v) + ".." + std::to_string(max_v) + "]");
        }
        return static_cast<int>(v);
    }
}
