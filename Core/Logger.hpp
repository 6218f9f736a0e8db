#pragma once

// Logger.hpp - Boost.Log с каналами (тегами подсистем).
// Использование: LOGI("firewall") << "Apply: table=" << name;

#include <boost/log/trivial.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

#include <cstddef>
#include <string>

namespace Logger
{
    using Severity = boost::log::trivial::severity_level;
    using Source   = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    struct Options
    {
        std::string app_name      = "TunnelWarden";
        std::string directory;                  // пусто - только консоль
        std::string base_filename = "warden";
        Severity    file_min_severity    = boost::log::trivial::info;
        Severity    console_min_severity = boost::log::trivial::info;
        std::size_t rotation_size = 10 * 1024 * 1024;
    };

    /**
     * @brief Глобальный источник записей (потокобезопасный).
     */
    Source &Get();

    /**
     * @brief Установить консольный и (опционально) файловый sink.
     * Повторный вызов заменяет ранее установленные sink-и.
     */
    void Init(const Options &opts);

    /**
     * @brief Сбросить буферы и снять sink-и, установленные Init().
     */
    void Shutdown();

    /**
     * @brief Разбор уровня из строки ("trace", "debug", "info", "warning", "error").
     * @return false, если строка не распознана.
     */
    bool ParseSeverity(const std::string &text, Severity &out);

    // RAII: Init() в конструкторе, Shutdown() в деструкторе.
    class Guard
    {
    public:
        explicit Guard(const Options &opts);
        ~Guard();

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;
    };
}

#define LOG_CHANNEL_(ch, lvl) \
    BOOST_LOG_CHANNEL_SEV(::Logger::Get(), std::string(ch), ::boost::log::trivial::lvl)

#define LOGT(ch) LOG_CHANNEL_(ch, trace)
#define LOGD(ch) LOG_CHANNEL_(ch, debug)
#define LOGI(ch) LOG_CHANNEL_(ch, info)
#define LOGW(ch) LOG_CHANNEL_(ch, warning)
#define LOGE(ch) LOG_CHANNEL_(ch, error)
