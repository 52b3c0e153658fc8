#include "Core/Logger.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/keywords/auto_flush.hpp>
#include <boost/log/keywords/file_name.hpp>
#include <boost/log/keywords/open_mode.hpp>
#include <boost/log/keywords/rotation_size.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

namespace logging  = boost::log;
namespace sinks    = boost::log::sinks;
namespace expr     = boost::log::expressions;
namespace keywords = boost::log::keywords;

BOOST_LOG_ATTRIBUTE_KEYWORD(a_severity,  "Severity",  Logger::Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(a_channel,   "Channel",   std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(a_timestamp, "TimeStamp", boost::posix_time::ptime)

namespace
{
    using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
    using FileSink    = sinks::synchronous_sink<sinks::text_file_backend>;

    auto MakeFormatter()
    {
        return expr::stream
               << expr::format_date_time(a_timestamp, "%Y-%m-%d %H:%M:%S.%f")
               << " [" << a_severity << "]"
               << " [" << a_channel << "] "
               << expr::smessage;
    }
}

namespace Logger
{
    Source &Get()
    {
        static Source source;
        return source;
    }

    Guard::Guard(const Options &opts)
    {
        logging::add_common_attributes();
        auto core = logging::core::get();

        // консоль: stderr, чтобы stdout оставался под вывод list
        auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
        console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
        console_backend->auto_flush(true);

        auto console = boost::make_shared<ConsoleSink>(console_backend);
        console->set_formatter(MakeFormatter());
        console->set_filter(a_severity >= opts.console_min_severity);
        core->add_sink(console);
        console_ = console;

        if (opts.directory.empty())
        {
            return;
        }

        std::error_code ec;
        std::filesystem::create_directories(opts.directory, ec);
        if (ec)
        {
            LOGW("logger") << "Cannot create log directory " << opts.directory
                           << ": " << ec.message() << " (console only)";
            return;
        }

        const std::filesystem::path pattern =
            std::filesystem::path(opts.directory) / (opts.base_filename + "_%Y%m%d_%N.log");

        auto file_backend = boost::make_shared<sinks::text_file_backend>(
            keywords::file_name     = pattern.string(),
            keywords::rotation_size = opts.rotation_size,
            keywords::open_mode     = std::ios_base::out | std::ios_base::app,
            keywords::auto_flush    = true);

        auto file = boost::make_shared<FileSink>(file_backend);
        file->set_formatter(MakeFormatter());
        file->set_filter(a_severity >= opts.file_min_severity);
        core->add_sink(file);
        file_ = file;

        LOGD("logger") << opts.app_name << ": file log " << pattern.string();
    }

    Guard::~Guard()
    {
        auto core = logging::core::get();
        core->flush();
        if (file_)
        {
            core->remove_sink(file_);
        }
        if (console_)
        {
            core->remove_sink(console_);
        }
    }
}
