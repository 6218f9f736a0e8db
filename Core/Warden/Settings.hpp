#pragma once

// Settings.hpp - конфигурация движка: JSON (Boost.JSON) + переопределения из окружения.
// Учётных данных здесь нет (см. Credentials).

#include "Types.hpp"

#include <chrono>
#include <string>
#include <vector>

struct Settings
{
    // политика (сырые строки, разбираются заново каждый цикл применения)
    std::string whitelist;
    std::string api_allowlist = "api.nordvpn.com";
    bool        kill_switch   = true;
    std::string iface         = "eth0";

    // проверка соединения
    std::vector<std::string> probe_urls = { "http://connectivitycheck.gstatic.com/generate_204" };
    int                  attempts         = 5;
    std::chrono::seconds attempt_interval { 10 };
    std::chrono::seconds check_interval   { 60 };
    std::chrono::seconds probe_timeout    { 2 };

    // туннель и соучастники
    std::string              auth_file      = "/tmp/auth";
    std::string              ovpn_file      = "/tmp/nordvpn.ovpn";
    std::vector<std::string> config_command = { "createvpnconfig.sh" };
    std::string              tunnel_service = "nordvpnd";
    std::string              service_dir    = "/run/service";
    std::string              s6_svc         = "s6-svc";
    std::string              tunnel_binary  = "openvpn";
    std::string              openvpn_opts;

    // firewall
    std::string table          = "warden";
    bool        revert_on_exit = false;

    // логирование
    std::string log_dir;
    std::string log_level = "info";
};

namespace SettingsLoader
{
    /**
     * @brief Разобрать JSON-объект (пустая строка - только значения по умолчанию),
     * затем наложить переменные окружения и проверить.
     * @throws std::runtime_error / std::invalid_argument при ошибке.
     */
    Settings Load(const std::string &json_text);

    // Переменные окружения поверх уже заполненных настроек.
    void ApplyEnvironment(Settings &s);

    // @throws std::invalid_argument
    void Validate(const Settings &s);

    // Разобрать политику из текущих сырых строк (вызывается на каждый цикл применения).
    Policy MakePolicy(const Settings &s);
}
