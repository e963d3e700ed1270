#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

namespace logging  = boost::log;
namespace expr     = boost::log::expressions;
namespace keywords = boost::log::keywords;

namespace
{
    BOOST_LOG_ATTRIBUTE_KEYWORD(channel_kw, "Channel", std::string)

    auto MakeFormatter()
    {
        return expr::stream
               << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
               << " [" << logging::trivial::severity << "]"
               << " [" << channel_kw << "] "
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

    Guard::Guard(const Options &options)
    {
        logging::add_common_attributes();

        auto console = logging::add_console_log(std::clog,
                                                keywords::format     = MakeFormatter(),
                                                keywords::auto_flush = true);
        console->set_filter(logging::trivial::severity >= options.console_min_severity);

        if (!options.directory.empty())
        {
            const std::string pattern = options.directory + "/" + options.base_filename + "_%Y%m%d_%N.log";

            auto file = logging::add_file_log(keywords::file_name     = pattern,
                                              keywords::rotation_size = options.rotation_size,
                                              keywords::open_mode     = std::ios_base::out | std::ios_base::app,
                                              keywords::format        = MakeFormatter(),
                                              keywords::auto_flush    = true);
            file->set_filter(logging::trivial::severity >= options.file_min_severity);
        }

        LOGD("logger") << "Logger started: app=" << options.app_name
                       << " dir=" << (options.directory.empty() ? std::string("<none>") : options.directory);
    }

    Guard::~Guard()
    {
        logging::core::get()->flush();
        logging::core::get()->remove_all_sinks();
    }

    Severity ParseSeverity(const std::string &text,
                           Severity           fallback)
    {
        std::string t = text;
        std::transform(t.begin(),
                       t.end(),
                       t.begin(),
                       [](unsigned char c)
                       {
                           return static_cast<char>(std::tolower(c));
                       });

        if (t == "trace")   return logging::trivial::trace;
        if (t == "debug")   return logging::trivial::debug;
        if (t == "info")    return logging::trivial::info;
        if (t == "warning" || t == "warn") return logging::trivial::warning;
        if (t == "error")   return logging::trivial::error;
        if (t == "fatal")   return logging::trivial::fatal;
        return fallback;
    }
} // namespace Logger
