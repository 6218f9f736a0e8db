#pragma once

/**
 * @file Collaborators.hpp
 * @brief Внешние соучастники: супервизор процессов (s6) и генератор конфига туннеля.
 *
 * Перезапуск туннеля - это команда супервизору, а не рестарт внутри процесса:
 * запущенным процессом туннеля владеет s6.
 */

#include <string>
#include <vector>

class ProcessSupervisor
{
public:
    virtual ~ProcessSupervisor() = default;

    // Бросают std::runtime_error, если команда не прошла.
    virtual void Start(const std::string &service) = 0;
    virtual void SignalRestart(const std::string &service) = 0;
};

class ConfigGenerator
{
public:
    virtual ~ConfigGenerator() = default;

    /**
     * @brief Сгенерировать конфиг туннеля заново.
     * @return Путь к конфигу.
     * @throws ConfigRegenerationFailed
     */
    virtual std::string Regenerate() = 0;
};

/**
 * @brief Запустить программу (PATH-поиск) и дождаться завершения.
 * @return Код выхода; 128+N при завершении сигналом N.
 * @throws std::runtime_error если запустить не удалось.
 */
int RunProgram(const std::vector<std::string> &argv);

// s6-svc -u / -h <service_dir>/<service>
class S6Supervisor final : public ProcessSupervisor
{
public:
    struct Params
    {
        std::string s6_svc      = "s6-svc";
        std::string service_dir = "/run/service";
    };

    explicit S6Supervisor(const Params &p);

    void Start(const std::string &service) override;
    void SignalRestart(const std::string &service) override;

private:
    void Control_(const char *flag, const std::string &service);

    Params p_;
};

// Внешняя команда (createvpnconfig.sh и т.п.), которая пишет конфиг в известный путь.
class CommandConfigGenerator final : public ConfigGenerator
{
public:
    struct Params
    {
        std::vector<std::string> command = { "createvpnconfig.sh" };
        std::string              output_path = "/tmp/nordvpn.ovpn";
    };

    explicit CommandConfigGenerator(const Params &p);

    std::string Regenerate() override;

private:
    Params p_;
};

namespace TunnelConfig
{
    /**
     * @brief Хосты из строк "remote <host> [port] [proto]" конфига OpenVPN.
     * Нет файла - пустой список.
     */
    std::vector<std::string> ReadRemotes(const std::string &path);

    /**
     * @brief argv для запуска клиента туннеля:
     * openvpn --config <ovpn> --auth-user-pass <auth> --auth-nocache <extra...>
     */
    std::vector<std::string> BuildLaunchArgv(const std::string &binary,
                                             const std::string &ovpn_file,
                                             const std::string &auth_file,
                                             const std::string &extra_opts);
}
