#include "Core/Logger.hpp"

#include <filesystem>
#include <iostream>
#include <memory>

#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/log/attributes/constant.hpp>
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

namespace
{
    BOOST_LOG_ATTRIBUTE_KEYWORD(a_severity,  "Severity",  Logger::Severity)
    BOOST_LOG_ATTRIBUTE_KEYWORD(a_channel,   "Channel",   std::string)
    BOOST_LOG_ATTRIBUTE_KEYWORD(a_timestamp, "TimeStamp", boost::posix_time::ptime)

    using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
    using FileSink    = sinks::synchronous_sink<sinks::text_file_backend>;

    auto MakeFormatter()
    {
        return expr::stream
            << "[" << expr::format_date_time(a_timestamp, "%Y-%m-%d %H:%M:%S.%f") << "]"
            << " [" << a_severity << "]"
            << " [" << a_channel << "] "
            << expr::smessage;
    }
}

bool Logger::ParseSeverity(const std::string &name, Severity &out)
{
    return logging::trivial::from_string(name.c_str(), name.size(), out);
}

Logger::Guard::Guard(const Options &options)
{
    Install_(options);
}

Logger::Guard::~Guard()
{
    Uninstall_();
}

void Logger::Guard::Reset(const Options &options)
{
    Uninstall_();
    Install_(options);
}

void Logger::Guard::Install_(const Options &options)
{
    auto core = logging::core::get();

    logging::add_common_attributes();
    core->add_global_attribute("AppName",
                               logging::attributes::constant<std::string>(options.app_name));

    // консоль — stderr, чтобы не мешать выводу команды в stdout
    auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
    console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    console_backend->auto_flush(true);

    auto console = boost::make_shared<ConsoleSink>(console_backend);
    console->set_filter(a_severity >= options.console_min_severity);
    console->set_formatter(MakeFormatter());
    core->add_sink(console);

    if (!options.directory.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(options.directory, ec);
        if (ec)
        {
            // файловый лог необязателен: продолжаем только с консолью
            LOGW("logger") << "Cannot create log directory " << options.directory
                           << ": " << ec.message();
        }
        else
        {
            const std::string pattern =
                (std::filesystem::path(options.directory) / (options.base_filename + "_%N.log")).string();

            auto file_backend = boost::make_shared<sinks::text_file_backend>(
                keywords::file_name     = pattern,
                keywords::rotation_size = options.rotation_size_bytes,
                keywords::open_mode     = std::ios_base::out | std::ios_base::app);
            file_backend->auto_flush(true);
            file_backend->set_file_collector(sinks::file::make_collector(
                keywords::target   = options.directory,
                keywords::max_size = options.max_files_bytes));
            file_backend->scan_for_files();

            auto file = boost::make_shared<FileSink>(file_backend);
            file->set_filter(a_severity >= options.file_min_severity);
            file->set_formatter(MakeFormatter());
            core->add_sink(file);
        }
    }

    installed_ = true;
    LOGD("logger") << "Logging started: app=" << options.app_name
                   << " dir=" << (options.directory.empty() ? "-" : options.directory);
}

void Logger::Guard::Uninstall_()
{
    if (!installed_) return;

    auto core = logging::core::get();
    core->flush();
    core->remove_all_sinks();
    installed_ = false;
}
