#pragma once

// Logger.hpp — логирование через Boost.Log.
// Консольный sink + (опционально) файловый с ротацией.
// Использование: LOGI("channel") << "text";

#include <cstddef>
#include <string>

#include <boost/shared_ptr.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/sinks/sink.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

namespace Logger
{
    using Severity = boost::log::trivial::severity_level;
    using Source   = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    struct Options
    {
        std::string app_name      = "PortForge";
        std::string directory;                    // пусто — только консоль
        std::string base_filename = "portforge";
        Severity    file_min_severity    = boost::log::trivial::info;
        Severity    console_min_severity = boost::log::trivial::info;
        std::size_t rotation_size        = 4 * 1024 * 1024;
    };

    /**
     * @brief RAII: регистрирует sink'и в boost::log::core и снимает их в деструкторе.
     */
    class Guard
    {
    public:
        explicit Guard(const Options &opts);
        ~Guard();

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        boost::shared_ptr<boost::log::sinks::sink> console_;
        boost::shared_ptr<boost::log::sinks::sink> file_;
    };

    // Глобальный источник записей (thread-safe).
    Source &Get();
}

#define PORTFORGE_LOG(sev, channel) \
    BOOST_LOG_CHANNEL_SEV(::Logger::Get(), std::string(channel), ::boost::log::trivial::sev)

#define LOGT(channel) PORTFORGE_LOG(trace,   channel)
#define LOGD(channel) PORTFORGE_LOG(debug,   channel)
#define LOGI(channel) PORTFORGE_LOG(info,    channel)
#define LOGW(channel) PORTFORGE_LOG(warning, channel)
#define LOGE(channel) PORTFORGE_LOG(error,   channel)
