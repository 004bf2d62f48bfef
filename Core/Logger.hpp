#pragma once

// Logger.hpp — тонкая обёртка над Boost.Log.
// Logger::Guard поднимает sink'и (консоль + опционально файл с ротацией)
// и снимает их в деструкторе. Писать через макросы LOG*("канал") << ...

#include <string>
#include <cstddef>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

namespace Logger
{
    using Severity = boost::log::trivial::severity_level;

    using ChannelLogger =
        boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(Global, ChannelLogger)

    struct Options
    {
        std::string app_name      = "cfg-adguard-dns";
        std::string directory;                       // пусто — файловый лог выключен
        std::string base_filename = "cfg-adguard-dns";

        Severity file_min_severity    = boost::log::trivial::info;
        Severity console_min_severity = boost::log::trivial::fatal;

        std::size_t rotation_size_bytes = 1 * 1024 * 1024;
        std::size_t max_files_bytes     = 8 * 1024 * 1024;
    };

    // "trace" | "debug" | "info" | "warning" | "error" | "fatal"
    bool ParseSeverity(const std::string &name, Severity &out);

    class Guard
    {
    public:
        explicit Guard(const Options &options);
        ~Guard();

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;

        // Пересобрать sink'и с новыми опциями (например, после чтения конфига)
        void Reset(const Options &options);

    private:
        void Install_(const Options &options);
        void Uninstall_();

        bool installed_ = false;
    };
}

#define CAD_LOG_(channel, sev) \
    BOOST_LOG_CHANNEL_SEV(::Logger::Global::get(), (channel), ::boost::log::trivial::sev)

#define LOGT(channel) CAD_LOG_(channel, trace)
#define LOGD(channel) CAD_LOG_(channel, debug)
#define LOGI(channel) CAD_LOG_(channel, info)
#define LOGW(channel) CAD_LOG_(channel, warning)
#define LOGE(channel) CAD_LOG_(channel, error)
