#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

/**
 * @file Logger.hpp
 * @brief Логирование на Boost.Log (консоль и ротация файлов, каналы по компонентам).
 *
 * Использование: LOGI("routes") << "message key=" << value;
 * Без Logger::Guard записи уходят в sink Boost.Log по умолчанию.
 */

namespace Logger
{
    using Severity = boost::log::trivial::severity_level;
    using Source   = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    /**
     * @brief Параметры инициализации логирования.
     */
    struct Options
    {
        std::string app_name      = "PodWeave";  ///< Имя приложения (первая запись лога).
        std::string directory;                   ///< Каталог файлов; пусто: только консоль.
        std::string base_filename = "podweave";  ///< Префикс имени файла.

        Severity file_min_severity    = boost::log::trivial::info;
        Severity console_min_severity = boost::log::trivial::info;

        std::size_t rotation_size = 10 * 1024 * 1024; ///< Размер файла до ротации, байт.
        std::size_t max_files     = 5;                ///< Сколько старых файлов хранить.
    };

    /**
     * @brief Глобальный потокобезопасный источник записей.
     */
    Source &Get();

    /**
     * @brief Разобрать имя уровня ("trace", "debug", "info", "warning", "error").
     * @param name Имя уровня (регистр не важен).
     * @param out Результат.
     * @return false, если имя неизвестно.
     */
    bool ParseSeverity(const std::string &name,
                       Severity          &out);

    /**
     * @brief RAII: ставит sink-и при создании и снимает их при разрушении.
     *
     * Один Guard на процесс.
     */
    class Guard
    {
    public:
        explicit Guard(const Options &options);
        ~Guard();

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;

    private:
        struct Sinks;
        std::unique_ptr<Sinks> sinks_;
    };
} // namespace Logger

#define PODWEAVE_LOG(channel, level) \
    BOOST_LOG_CHANNEL_SEV(::Logger::Get(), std::string(channel), ::boost::log::trivial::level)

#define LOGT(channel) PODWEAVE_LOG(channel, trace)
#define LOGD(channel) PODWEAVE_LOG(channel, debug)
#define LOGI(channel) PODWEAVE_LOG(channel, info)
#define LOGW(channel) PODWEAVE_LOG(channel, warning)
#define LOGE(channel) PODWEAVE_LOG(channel, error)
