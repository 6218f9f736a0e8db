#include "AddressResolver.hpp"
#include "Errors.hpp"
#include "PolicyInput.hpp"
#include "Core/Logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

std::set<Destination> SystemResolver::Resolve(const BypassEntry &entry)
{
    if (const auto lit = PolicyInput::ParseLiteral(entry.raw))
    {
        return { *lit };
    }

    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver(ioc);
    boost::system::error_code ec;

    const auto results = resolver.resolve(entry.raw, "", ec);
    if (ec)
    {
        throw ResolutionFailed(entry.raw + ": " + ec.message());
    }

    std::set<Destination> out;
    for (const auto &r : results)
    {
        boost::asio::ip::address a = r.endpoint().address();
        if (a.is_v6() && a.to_v6().is_v4_mapped())
        {
            a = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, a.to_v6());
        }
        out.insert(Destination{a.is_v4() ? IpFamily::V4 : IpFamily::V6, a.to_string()});
    }

    if (out.empty())
    {
        throw ResolutionFailed(entry.raw + ": empty answer");
    }

    LOGT("resolver") << entry.raw << " -> " << out.size() << " address(es)";
    return out;
}
