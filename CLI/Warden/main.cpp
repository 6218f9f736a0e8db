// main.cpp - CLI движка.
//   warden run [config.json]          - надзор за туннелем до SIGINT/SIGTERM
//   warden exec-tunnel [config.json]  - exec клиента туннеля (run-скрипт сервиса)
//   warden print-rules [config.json]  - собрать политику и напечатать транзакции nft

#include "Core/Warden/AddressResolver.hpp"
#include "Core/Warden/FirewallRules.hpp"
#include "Core/Warden/PolicyBuilder.hpp"
#include "Core/Warden/Settings.hpp"
#include "Core/Warden/Warden.hpp"
#include "Core/Logger.hpp"

#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

static volatile std::sig_atomic_t g_signalled = 0;

static void OnSignal(int)
{
    g_signalled = 1;
}

static int Usage(const char *argv0)
{
    std::cerr << "usage: " << argv0 << " run|exec-tunnel|print-rules [config.json]\n";
    return 64;
}

static bool ReadFile(const std::string &path, std::string &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

static int Run(std::string &config)
{
    std::signal(SIGINT,  OnSignal);
    std::signal(SIGTERM, OnSignal);

    if (Start(config.data()) != 0)
    {
        std::cerr << "already running\n";
        return 1;
    }

    while (IsRunning())
    {
        if (g_signalled)
        {
            Stop();
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    // join движка: код Main (1 - FAILED) становится кодом процесса
    return Wait();
}

static int PrintRules(const std::string &config)
{
    Settings settings = SettingsLoader::Load(config);
    Logger::Options opts;
    opts.console_min_severity = boost::log::trivial::warning;
    Logger::Guard lg(opts);

    SystemResolver resolver;
    PolicyBuilder builder(resolver);
    const PolicyBuilder::Result built = builder.Build(SettingsLoader::MakePolicy(settings));

    FirewallRules::Params params;
    params.table_name = settings.table;
    std::cout << FirewallRules::Render(params, IpFamily::V4, RulesForFamily(built.rules, IpFamily::V4)) << "\n"
              << FirewallRules::Render(params, IpFamily::V6, RulesForFamily(built.rules, IpFamily::V6));
    for (const std::string &w : built.warnings) std::cerr << "warning: " << w << "\n";
    return 0;
}

int main(int argc, char **argv)
{
    if (argc < 2 || argc > 3) return Usage(argv[0]);

    const std::string command = argv[1];
    std::string config;
    if (argc == 3 && !ReadFile(argv[2], config))
    {
        std::cerr << "cannot read " << argv[2] << ": " << std::strerror(errno) << "\n";
        return 66;
    }

    try
    {
        if (command == "run")         return Run(config);
        if (command == "exec-tunnel") return Warden::ExecTunnel(SettingsLoader::Load(config));
        if (command == "print-rules") return PrintRules(config);
    }
    catch (const std::exception &e)
    {
        std::cerr << command << ": " << e.what() << "\n";
        return 1;
    }
    return Usage(argv[0]);
}
