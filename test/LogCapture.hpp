#pragma once

// Перехват сообщений Boost.Log в строку на время жизни объекта.

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>

#include <sstream>
#include <string>

class LogCapture {
public:
    using Sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

    LogCapture() {
        auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
        backend->add_stream(boost::shared_ptr<std::ostream>(&out_, boost::null_deleter()));
        backend->auto_flush(true);
        sink_ = boost::make_shared<Sink>(backend);
        sink_->set_formatter(boost::log::expressions::stream << boost::log::expressions::smessage);
        boost::log::core::get()->add_sink(sink_);
    }

    ~LogCapture() {
        boost::log::core::get()->remove_sink(sink_);
        sink_->flush();
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string Text() const { return out_.str(); }

private:
    std::ostringstream out_;
    boost::shared_ptr<Sink> sink_;
};
