// Warden.cpp - сборка компонентов движка и экспортируемый Start/Stop/IsRunning/Wait.

#include "Warden.hpp"
#include "AddressResolver.hpp"
#include "Collaborators.hpp"
#include "ConnectionSupervisor.hpp"
#include "ConnectivityProbe.hpp"
#include "Credentials.hpp"
#include "EngineThread.hpp"
#include "FirewallRules.hpp"
#include "NetWatcher.hpp"
#include "Platform.hpp"
#include "PolicyBuilder.hpp"
#include "Settings.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>

#include <unistd.h>

static EngineThread g_engine;

static bool IsElevated()
{
    return (::geteuid() == 0);
}

static Logger::Options MakeLogOptions(const Settings &s)
{
    Logger::Options opts;
    opts.app_name      = "TunnelWarden";
    opts.directory     = s.log_dir;
    opts.base_filename = "warden";

    Logger::Severity sev = boost::log::trivial::info;
    if (!Logger::ParseSeverity(s.log_level, sev))
    {
        sev = boost::log::trivial::info;
    }
    opts.file_min_severity    = sev;
    opts.console_min_severity = sev;
    return opts;
}

namespace Warden
{
    int ExecTunnel(const Settings &settings)
    {
        const std::vector<std::string> args = TunnelConfig::BuildLaunchArgv(settings.tunnel_binary,
                                                                            settings.ovpn_file,
                                                                            settings.auth_file,
                                                                            settings.openvpn_opts);
        std::vector<char *> argv;
        argv.reserve(args.size() + 1);
        for (const std::string &a : args) argv.push_back(const_cast<char *>(a.c_str()));
        argv.push_back(nullptr);

        {
            Logger::Guard lg(MakeLogOptions(settings));
            LOGI("warden") << "Starting " << args.front() << " (" << settings.ovpn_file << ")";
        }

        ::execvp(argv[0], argv.data());

        const int err = errno;
        std::fprintf(stderr, "execvp %s: %s\n", argv[0], std::strerror(err));
        return err == ENOENT ? 127 : 126;
    }

    int Main(const std::string &config_json, std::stop_token st)
    {
        Settings settings;
        try
        {
            settings = SettingsLoader::Load(config_json);
        }
        catch (const std::exception &e)
        {
            Logger::Guard lg(Logger::Options{});
            LOGE("config") << "Invalid configuration: " << e.what();
            return 2;
        }

        Logger::Guard lg(MakeLogOptions(settings));

        const PlatformProfile &platform = Platform::Current();
        LOGI("warden") << "Starting TunnelWarden (" << platform.platform << ", "
                       << (platform.machine[0] ? platform.machine : "unknown machine") << ")";

        if (!IsElevated())
        {
            LOGE("warden") << "Please run as root";
            return 3;
        }

        SystemResolver resolver;
        PolicyBuilder  builder(resolver);

        std::unique_ptr<NftBackend> backend;
        try
        {
            backend = std::make_unique<NftBackend>();
        }
        catch (const std::exception &e)
        {
            LOGE("firewall") << "nftables unavailable: " << e.what();
            return 1;
        }

        FirewallRules::Params fw_params;
        fw_params.table_name = settings.table;
        FirewallRules firewall(fw_params, *backend);

        BeastHttpChecker  checker;
        ConnectivityProbe probe(checker, InterruptibleSleep,
                                std::chrono::duration_cast<std::chrono::milliseconds>(settings.probe_timeout));

        S6Supervisor processes(S6Supervisor::Params{ settings.s6_svc, settings.service_dir });
        CommandConfigGenerator generator(CommandConfigGenerator::Params{ settings.config_command,
                                                                         settings.ovpn_file });

        ConnectionSupervisor::Params sp;
        sp.probe_urls       = settings.probe_urls;
        sp.max_attempts     = settings.attempts;
        sp.attempt_interval = settings.attempt_interval;
        sp.check_interval   = settings.check_interval;
        sp.tunnel_service   = settings.tunnel_service;

        ConnectionSupervisor supervisor(
            sp,
            ConnectionSupervisor::Collaborators{ builder, firewall, probe, processes, generator, InterruptibleSleep },
            [&settings]() { return SettingsLoader::MakePolicy(settings); },
            [&settings]() { CredentialsFile::Materialize(settings.auth_file); });

        std::unique_ptr<NetWatcher> watcher;
        try
        {
            watcher = std::make_unique<NetWatcher>([&supervisor]() { supervisor.RequestReapply(); });
        }
        catch (const std::exception &e)
        {
            LOGW("netwatcher") << "Network change tracking disabled: " << e.what();
        }

        const ConnectionState last = supervisor.Run(st);

        if (watcher) watcher->Stop();

        if (settings.revert_on_exit && last != ConnectionState::Failed)
        {
            LOGI("warden") << "Removing firewall rules";
            firewall.Revert();
        }
        else if (firewall.Applied())
        {
            LOGI("warden") << "Firewall rules left in place";
        }

        LOGI("warden") << "Stopped in " << ToString(last);
        return last == ConnectionState::Failed ? 1 : 0;
    }
}

EXPORT int32_t Start(char *cfg)
{
    std::string config = cfg ? cfg : "";
    const bool started = g_engine.Start([config](std::stop_token st)
       {
           return Warden::Main(config, st);
       });

    return started ? 0 : -1; // -1: уже запущено
}

EXPORT int32_t Stop(void)
{
    return g_engine.RequestStop() ? 0 : -2; // -2: не запущено
}

EXPORT int32_t IsRunning(void)
{
    return g_engine.IsRunning() ? 1 : 0;
}

EXPORT int32_t Wait(void)
{
    return g_engine.Wait();
}
