#include "Core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
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
BOOST_LOG_ATTRIBUTE_KEYWORD(a_thread,    "ThreadID",  logging::attributes::current_thread_id::value_type)

namespace Logger
{
    namespace
    {
        using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
        using FileSink    = sinks::synchronous_sink<sinks::text_file_backend>;

        logging::formatter MakeFormatter()
        {
            return expr::stream
                << expr::format_date_time(a_timestamp, "%Y-%m-%d %H:%M:%S.%f")
                << " [" << a_severity << "]"
                << " [" << a_thread << "]"
                << " [" << a_channel << "] "
                << expr::smessage;
        }
    }

    struct Guard::Sinks
    {
        boost::shared_ptr<ConsoleSink> console;
        boost::shared_ptr<FileSink>    file;
    };

    Source &Get()
    {
        static Source source;
        return source;
    }

    bool ParseSeverity(const std::string &name,
                       Severity          &out)
    {
        std::string n = name;
        std::transform(n.begin(), n.end(), n.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (n == "trace")                   { out = boost::log::trivial::trace;   return true; }
        if (n == "debug")                   { out = boost::log::trivial::debug;   return true; }
        if (n == "info")                    { out = boost::log::trivial::info;    return true; }
        if (n == "warning" || n == "warn")  { out = boost::log::trivial::warning; return true; }
        if (n == "error")                   { out = boost::log::trivial::error;   return true; }
        if (n == "fatal")                   { out = boost::log::trivial::fatal;   return true; }
        return false;
    }

    Guard::Guard(const Options &options)
        : sinks_(std::make_unique<Sinks>())
    {
        auto core = logging::core::get();
        logging::add_common_attributes();

        auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
        console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
        console_backend->auto_flush(true);

        sinks_->console = boost::make_shared<ConsoleSink>(console_backend);
        sinks_->console->set_formatter(MakeFormatter());
        sinks_->console->set_filter(a_severity >= options.console_min_severity);
        core->add_sink(sinks_->console);

        if (!options.directory.empty())
        {
            auto file_backend = boost::make_shared<sinks::text_file_backend>(
                keywords::file_name     = options.directory + "/" + options.base_filename + "_%Y%m%d_%N.log",
                keywords::rotation_size = options.rotation_size,
                keywords::open_mode     = std::ios_base::app);
            file_backend->auto_flush(true);
            file_backend->set_file_collector(sinks::file::make_collector(
                keywords::target    = options.directory,
                keywords::max_files = options.max_files));
            file_backend->scan_for_files();

            sinks_->file = boost::make_shared<FileSink>(file_backend);
            sinks_->file->set_formatter(MakeFormatter());
            sinks_->file->set_filter(a_severity >= options.file_min_severity);
            core->add_sink(sinks_->file);
        }

        LOGI("agent") << options.app_name << ": logging started"
                      << " dir=" << (options.directory.empty() ? "-" : options.directory);
    }

    Guard::~Guard()
    {
        auto core = logging::core::get();
        if (sinks_->file)
        {
            sinks_->file->flush();
            core->remove_sink(sinks_->file);
        }
        if (sinks_->console)
        {
            sinks_->console->flush();
            core->remove_sink(sinks_->console);
        }
    }
} // namespace Logger
