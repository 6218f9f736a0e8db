#include "PolicyInput.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <boost/asio/ip/network_v6.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace
{
    std::string Trim(const std::string &s)
    {
        const std::size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return std::string();
        const std::size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    bool AllDigits(const std::string &s)
    {
        return !s.empty() && std::all_of(s.begin(), s.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    std::string Lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

namespace PolicyInput
{
    std::string StripBrackets(const std::string &s)
    {
        if (s.size() >= 2 && s.front() == '[' && s.back() == ']')
            return s.substr(1, s.size() - 2);
        return s;
    }

    std::vector<std::string> Split(const std::string &text, const std::string &delims)
    {
        std::vector<std::string> out;
        std::size_t start = 0;
        while (start <= text.size())
        {
            const std::size_t pos = text.find_first_of(delims, start);
            const std::string tok = Trim(pos == std::string::npos ? text.substr(start)
                                                                  : text.substr(start, pos - start));
            if (!tok.empty()) out.push_back(tok);
            if (pos == std::string::npos) break;
            start = pos + 1;
        }
        return out;
    }

    std::optional<Destination> ParseLiteral(const std::string &text)
    {
        namespace ip = boost::asio::ip;
        boost::system::error_code ec;

        const std::string t = StripBrackets(Trim(text));
        const std::size_t slash = t.find('/');
        const ip::address addr = ip::make_address(t.substr(0, slash), ec);
        if (ec) return std::nullopt;

        const IpFamily family = addr.is_v4() ? IpFamily::V4 : IpFamily::V6;
        if (slash == std::string::npos)
        {
            return Destination{family, addr.to_string()};
        }

        const std::string prefix_text = t.substr(slash + 1);
        if (!AllDigits(prefix_text) || prefix_text.size() > 3) return std::nullopt;
        const int prefix  = std::stoi(prefix_text);
        const int max_len = addr.is_v4() ? 32 : 128;
        if (prefix > max_len) return std::nullopt;
        if (prefix == max_len)
        {
            return Destination{family, addr.to_string()};
        }

        const auto len = static_cast<unsigned short>(prefix);
        if (addr.is_v4())
        {
            return Destination{family, ip::make_network_v4(addr.to_v4(), len).canonical().to_string()};
        }
        return Destination{family, ip::make_network_v6(addr.to_v6(), len).canonical().to_string()};
    }

    bool IsIpLiteral(const std::string &text)
    {
        return ParseLiteral(text).has_value();
    }

    std::optional<BypassEntry> Normalize(const std::string &token)
    {
        std::string t = Trim(token);

        const std::size_t scheme = t.find("://");
        if (scheme != std::string::npos)
        {
            t = t.substr(scheme + 3);
        }

        // user@host
        const std::size_t at = t.find('@');
        if (at != std::string::npos && at < t.find('/'))
        {
            t = t.substr(at + 1);
        }

        const std::size_t slash = t.find('/');
        if (slash != std::string::npos)
        {
            const std::string head = t.substr(0, slash);
            const std::string tail = t.substr(slash + 1);
            // "10.0.0.0/8" - CIDR, всё остальное после '/' - путь
            const bool is_cidr = AllDigits(tail) && IsIpLiteral(head);
            if (!is_cidr) t = head;
        }

        if (!t.empty() && t.front() == '[')
        {
            // [2001:db8::1]:443
            const std::size_t close = t.find(']');
            if (close != std::string::npos) t = t.substr(1, close - 1);
        }
        else if (std::count(t.begin(), t.end(), ':') == 1)
        {
            // host:port (IPv6 без скобок содержит больше одного ':')
            t = t.substr(0, t.find(':'));
        }

        if (t.empty()) return std::nullopt;

        if (const auto lit = ParseLiteral(t))
        {
            return BypassEntry{lit->text};
        }
        return BypassEntry{Lower(t)};
    }

    std::vector<BypassEntry> ParseList(const std::string &text)
    {
        std::vector<BypassEntry> out;
        std::unordered_set<std::string> seen;
        for (const std::string &tok : Split(text, ";,"))
        {
            auto entry = Normalize(tok);
            if (!entry) continue;
            if (seen.insert(entry->raw).second)
            {
                out.push_back(std::move(*entry));
            }
        }
        return out;
    }
}
