#pragma once

// Warden.hpp - точка входа движка: экспортируемый C ABI (Start/Stop/IsRunning/Wait)
// и функции, общие для CLI.

#include <cstdint>
#include <stop_token>
#include <string>

#if defined(_WIN32)
#define EXPORT extern "C" __declspec(dllexport)
#else
#define EXPORT extern "C" __attribute__((visibility("default")))
#endif

struct Settings;

namespace Warden
{
    /**
     * @brief Полный цикл: настройки -> логгер -> политика -> туннель -> надзор до остановки.
     * @param config_json JSON-объект настроек (пустая строка - значения по умолчанию + окружение).
     * @return 0 - остановлен по запросу; 1 - FAILED; 2 - ошибка настроек; 3 - нет прав.
     */
    int Main(const std::string &config_json, std::stop_token st);

    /**
     * @brief Заменить процесс клиентом туннеля (openvpn ...). Используется как run-скрипт сервиса.
     * @return Только при ошибке exec: код для exit().
     */
    int ExecTunnel(const Settings &settings);
}

// Запустить движок в фоновом потоке. cfg - JSON (может быть пустой строкой).
// 0 - запущен, -1 - уже запущен. Завершившийся прошлый запуск join-ится.
EXPORT int32_t Start(char *cfg);

// Мягкая остановка без блокировки вызывающего. 0 - ок, -2 - не запущен.
EXPORT int32_t Stop(void);

// 1 - запущен, 0 - остановлен
EXPORT int32_t IsRunning(void);

// Дождаться завершения движка: код Warden::Main (0 - остановлен, 1 - FAILED, 2, 3).
EXPORT int32_t Wait(void);
