#include "Core/Logger.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>

#include <filesystem>
#include <iostream>
#include <mutex>

namespace logging  = boost::log;
namespace expr     = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace sinks    = boost::log::sinks;

BOOST_LOG_ATTRIBUTE_KEYWORD(a_severity,  "Severity",  Logger::Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(a_channel,   "Channel",   std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(a_timestamp, "TimeStamp", boost::posix_time::ptime)

namespace
{
    using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
    using FileSink    = sinks::synchronous_sink<sinks::text_file_backend>;

    std::mutex                    g_mu;
    boost::shared_ptr<ConsoleSink> g_console;
    boost::shared_ptr<FileSink>    g_file;
    bool                          g_common_added = false;

    void RemoveSinks_()
    {
        auto core = logging::core::get();
        if (g_console)
        {
            core->remove_sink(g_console);
            g_console.reset();
        }
        if (g_file)
        {
            g_file->flush();
            core->remove_sink(g_file);
            g_file.reset();
        }
    }
}

namespace Logger
{
    Source &Get()
    {
        static Source source(keywords::channel = std::string("warden"));
        return source;
    }

    void Init(const Options &opts)
    {
        std::lock_guard<std::mutex> lk(g_mu);

        if (!g_common_added)
        {
            logging::add_common_attributes();
            g_common_added = true;
        }
        RemoveSinks_();

        const auto format = expr::stream
            << "[" << expr::format_date_time(a_timestamp, "%Y-%m-%d %H:%M:%S.%f") << "] "
            << "[" << a_severity << "] "
            << "[" << a_channel << "] "
            << expr::smessage;

        g_console = logging::add_console_log(
            std::clog,
            keywords::format     = format,
            keywords::filter     = a_severity >= opts.console_min_severity,
            keywords::auto_flush = true);

        if (!opts.directory.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(opts.directory, ec);
            if (ec)
            {
                std::cerr << "[" << opts.app_name << "] cannot create log directory "
                          << opts.directory << ": " << ec.message() << "\n";
                return;
            }

            const std::string pattern =
                (std::filesystem::path(opts.directory) / (opts.base_filename + "_%Y%m%d_%N.log")).string();

            g_file = logging::add_file_log(
                keywords::file_name     = pattern,
                keywords::rotation_size = opts.rotation_size,
                keywords::open_mode     = std::ios_base::app,
                keywords::format        = format,
                keywords::filter        = a_severity >= opts.file_min_severity,
                keywords::auto_flush    = true);
        }
    }

    void Shutdown()
    {
        std::lock_guard<std::mutex> lk(g_mu);
        RemoveSinks_();
    }

    bool ParseSeverity(const std::string &text, Severity &out)
    {
        if (text.rfind("trace", 0) == 0) { out = boost::log::trivial::trace;   return true; }
        if (text == "debug")             { out = boost::log::trivial::debug;   return true; }
        if (text == "info")              { out = boost::log::trivial::info;    return true; }
        if (text == "warning")           { out = boost::log::trivial::warning; return true; }
        if (text == "error")             { out = boost::log::trivial::error;   return true; }
        return false;
    }

    Guard::Guard(const Options &opts)
    {
        Init(opts);
    }

    Guard::~Guard()
    {
        Shutdown();
    }
}
