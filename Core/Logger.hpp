#pragma once

#include <cstddef>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

/**
 * @file Logger.hpp
 * @brief Логирование через Boost.Log: severity + channel.
 *
 * Использование: LOGI("provisioner") << "text " << value;
 * stdout занят протоколом, поэтому консольный sink пишет в stderr.
 */

namespace Logger
{
    using Severity = boost::log::trivial::severity_level;
    using Source   = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    /**
     * @brief Параметры инициализации sink-ов.
     */
    struct Options
    {
        std::string app_name      = "macvlan"; ///< Имя приложения в первой записи.
        std::string directory;                 ///< Каталог логов; пусто: без файла.
        std::string base_filename = "macvlan"; ///< Префикс имени файла.

        Severity file_min_severity    = boost::log::trivial::debug;
        Severity console_min_severity = boost::log::trivial::info;

        std::size_t rotation_size = 10 * 1024 * 1024; ///< Ротация файла по размеру.
    };

    /**
     * @brief RAII: ставит sink-и в конструкторе, сбрасывает и снимает в деструкторе.
     */
    class Guard
    {
    public:
        explicit Guard(const Options &options);
        ~Guard();

        Guard(const Guard &)            = delete;
        Guard &operator=(const Guard &) = delete;
    };

    /**
     * @brief Глобальный источник записей.
     */
    Source &Get();

    /**
     * @brief Разобрать уровень ("trace".."fatal", без учёта регистра).
     * @param text Строка уровня.
     * @param fallback Значение при пустой/неизвестной строке.
     */
    Severity ParseSeverity(const std::string &text,
                           Severity           fallback);
} // namespace Logger

#define LOG_SEV_(channel, sev) BOOST_LOG_CHANNEL_SEV(::Logger::Get(), std::string(channel), (sev))

#define LOGT(channel) LOG_SEV_(channel, ::boost::log::trivial::trace)
#define LOGD(channel) LOG_SEV_(channel, ::boost::log::trivial::debug)
#define LOGI(channel) LOG_SEV_(channel, ::boost::log::trivial::info)
#define LOGW(channel) LOG_SEV_(channel, ::boost::log::trivial::warning)
#define LOGE(channel) LOG_SEV_(channel, ::boost::log::trivial::error)
