#include "ConnectivityProbe.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>

#include <openssl/ssl.h>

#include <condition_variable>
#include <memory>
#include <mutex>

namespace
{
    namespace net   = boost::asio;
    namespace ssl   = boost::asio::ssl;
    namespace beast = boost::beast;
    namespace http  = boost::beast::http;
    using tcp       = boost::asio::ip::tcp;

    struct Url
    {
        bool        tls = false;
        std::string host;
        std::string port;
        std::string target = "/";
    };

    Url ParseUrl(const std::string &text)
    {
        Url u;
        std::string rest = text;

        const std::size_t scheme = rest.find("://");
        if (scheme != std::string::npos)
        {
            const std::string s = rest.substr(0, scheme);
            if (s == "https")     u.tls = true;
            else if (s != "http") throw ProbeTransportError(text + ": unsupported scheme '" + s + "'");
            rest = rest.substr(scheme + 3);
        }

        const std::size_t slash = rest.find('/');
        std::string authority = rest.substr(0, slash);
        if (slash != std::string::npos) u.target = rest.substr(slash);

        if (!authority.empty() && authority.front() == '[')
        {
            const std::size_t close = authority.find(']');
            if (close == std::string::npos) throw ProbeTransportError(text + ": bad IPv6 literal");
            u.host = authority.substr(1, close - 1);
            if (close + 1 < authority.size() && authority[close + 1] == ':')
                u.port = authority.substr(close + 2);
        }
        else
        {
            const std::size_t colon = authority.find(':');
            u.host = authority.substr(0, colon);
            if (colon != std::string::npos) u.port = authority.substr(colon + 1);
        }

        if (u.host.empty()) throw ProbeTransportError(text + ": empty host");
        if (u.port.empty()) u.port = u.tls ? "443" : "80";
        return u;
    }

    struct Outcome
    {
        beast::error_code ec;
        int               status = 0;
        bool              done   = false;
    };

    template <class Stream>
    void SendHead(Stream                                   &stream,
                  http::request<http::empty_body>          &req,
                  beast::flat_buffer                       &buf,
                  http::response_parser<http::empty_body>  &parser,
                  Outcome                                  &out)
    {
        http::async_write(stream, req, [&](beast::error_code ec, std::size_t)
        {
            if (ec) { out.ec = ec; out.done = true; return; }
            http::async_read_header(stream, buf, parser, [&](beast::error_code ec2, std::size_t)
            {
                out.ec   = ec2;
                out.done = true;
                if (!ec2) out.status = static_cast<int>(parser.get().result_int());
            });
        });
    }
}

int BeastHttpChecker::Head(const std::string &url, std::chrono::milliseconds timeout)
{
    const Url u = ParseUrl(url);

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    Outcome         out;

    http::request<http::empty_body> req{http::verb::head, u.target, 11};
    req.set(http::field::host, u.host);
    req.set(http::field::user_agent, "tunnel-warden-probe");
    req.set(http::field::connection, "close");

    beast::flat_buffer buf;
    http::response_parser<http::empty_body> parser;
    parser.skip(true); // у ответа на HEAD тела нет

    std::unique_ptr<ssl::context>                         ctx;
    std::unique_ptr<beast::tcp_stream>                  plain;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> secure;

    if (!u.tls)
    {
        plain = std::make_unique<beast::tcp_stream>(ioc);
        plain->expires_after(timeout);
        resolver.async_resolve(u.host, u.port,
            [&](beast::error_code ec, tcp::resolver::results_type results)
            {
                if (ec) { out.ec = ec; out.done = true; return; }
                plain->async_connect(results, [&](beast::error_code ec2, const tcp::endpoint &)
                {
                    if (ec2) { out.ec = ec2; out.done = true; return; }
                    SendHead(*plain, req, buf, parser, out);
                });
            });
    }
    else
    {
        // контекст нужен только для https; сбой OpenSSL - ошибка транспорта этого URL
        try
        {
            ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
            ctx->set_default_verify_paths();
            secure = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(ioc, *ctx);
        }
        catch (const boost::system::system_error &e)
        {
            throw ProbeTransportError(url + ": TLS setup failed: " + e.what());
        }
        if (!SSL_set_tlsext_host_name(secure->native_handle(), u.host.c_str()))
        {
            throw ProbeTransportError(url + ": SNI setup failed");
        }
        secure->set_verify_mode(ssl::verify_peer);
        secure->set_verify_callback(ssl::host_name_verification(u.host));
        beast::get_lowest_layer(*secure).expires_after(timeout);

        resolver.async_resolve(u.host, u.port,
            [&](beast::error_code ec, tcp::resolver::results_type results)
            {
                if (ec) { out.ec = ec; out.done = true; return; }
                beast::get_lowest_layer(*secure).async_connect(results,
                    [&](beast::error_code ec2, const tcp::endpoint &)
                    {
                        if (ec2) { out.ec = ec2; out.done = true; return; }
                        secure->async_handshake(ssl::stream_base::client, [&](beast::error_code ec3)
                        {
                            if (ec3) { out.ec = ec3; out.done = true; return; }
                            SendHead(*secure, req, buf, parser, out);
                        });
                    });
            });
    }

    // resolve не покрыт таймаутом stream-а - ограничиваем весь обмен
    ioc.run_for(timeout);

    if (!out.done) throw ProbeTransportError(url + ": timed out");
    if (out.ec)    throw ProbeTransportError(url + ": " + out.ec.message());
    return out.status;
}

bool InterruptibleSleep(std::chrono::milliseconds duration, std::stop_token st)
{
    std::mutex                  mu;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lk(mu);
    cv.wait_for(lk, st, duration, [] { return false; });
    return !st.stop_requested();
}

StatusClass ClassifyStatus(int http_status)
{
    switch (http_status / 100)
    {
        case 1: return StatusClass::Informational;
        case 2: return StatusClass::Success;
        case 3: return StatusClass::Redirect;
        case 4: return StatusClass::ClientError;
        case 5: return StatusClass::ServerError;
        default: return StatusClass::None;
    }
}

ConnectivityProbe::ConnectivityProbe(HttpChecker              &checker,
                                     SleepFn                   sleep,
                                     std::chrono::milliseconds request_timeout)
    : checker_(checker)
    , sleep_(std::move(sleep))
    , timeout_(request_timeout)
{
}

ProbeResult ConnectivityProbe::ProbeOnce(const std::string &endpoint)
{
    ProbeResult r;
    r.endpoint = endpoint;
    try
    {
        const int status = checker_.Head(endpoint, timeout_);
        r.status_class = ClassifyStatus(status);
        // 2xx/3xx - успех; 5xx и всё прочее - нет
        r.succeeded = (r.status_class == StatusClass::Success || r.status_class == StatusClass::Redirect);
        LOGT("probe") << endpoint << " -> HTTP " << status;
    }
    catch (const ProbeTransportError &e)
    {
        LOGD("probe") << "Transport error: " << e.what();
    }
    catch (const std::exception &e)
    {
        LOGW("probe") << endpoint << ": check failed: " << e.what();
    }
    return r;
}

bool ConnectivityProbe::Check(const std::vector<std::string> &endpoints,
                              int                             max_attempts,
                              std::chrono::milliseconds       interval,
                              std::stop_token                 st)
{
    if (endpoints.empty())
    {
        LOGW("probe") << "No probe endpoints configured";
        return false;
    }
    if (max_attempts < 1) max_attempts = 1;

    LOGD("probe") << "Check VPN Internet connection";

    for (int attempt = 1; attempt <= max_attempts; ++attempt)
    {
        for (const std::string &url : endpoints)
        {
            if (st.stop_requested()) return false;

            const ProbeResult r = ProbeOnce(url);
            if (r.succeeded)
            {
                LOGD("probe") << "Connection via VPN is up (" << url << ")";
                return true;
            }
            LOGI("probe") << "Iteration " << attempt << "(" << max_attempts << "), url=" << url
                          << ", class=" << static_cast<int>(r.status_class)
                          << ", connection via VPN is down";
        }

        if (attempt == max_attempts) break;

        LOGD("probe") << "Sleep between iterations for " << interval.count() << " ms";
        if (!sleep_(interval, st)) return false;
    }

    LOGW("probe") << "Connection via VPN is down after " << max_attempts << " attempt(s)";
    return false;
}
