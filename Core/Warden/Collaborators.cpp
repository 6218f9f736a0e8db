#include "Collaborators.hpp"
#include "Errors.hpp"
#include "PolicyInput.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spawn.h>
#include <sys/wait.h>

extern char **environ;

int RunProgram(const std::vector<std::string> &argv)
{
    if (argv.empty() || argv.front().empty())
    {
        throw std::invalid_argument("RunProgram: empty argv");
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const std::string &a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = 0;
    const int rc = ::posix_spawnp(&pid, cargv[0], nullptr, nullptr, cargv.data(), environ);
    if (rc != 0)
    {
        throw std::runtime_error("spawn " + argv.front() + ": " + std::strerror(rc));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno == EINTR) continue;
        throw std::runtime_error("waitpid " + argv.front() + ": " + std::strerror(errno));
    }

    if (WIFEXITED(status))   return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ---------- S6Supervisor ----------

S6Supervisor::S6Supervisor(const Params &p)
    : p_(p)
{
    if (p_.s6_svc.empty()) throw std::invalid_argument("S6Supervisor: s6_svc is empty");
}

void S6Supervisor::Control_(const char *flag, const std::string &service)
{
    const std::string dir = (std::filesystem::path(p_.service_dir) / service).string();
    LOGD("collab") << p_.s6_svc << " " << flag << " " << dir;

    const int code = RunProgram({ p_.s6_svc, flag, dir });
    if (code != 0)
    {
        throw std::runtime_error(p_.s6_svc + " " + flag + " " + dir + " exited with " + std::to_string(code));
    }
}

void S6Supervisor::Start(const std::string &service)
{
    LOGI("collab") << "Start service " << service;
    Control_("-u", service);
}

void S6Supervisor::SignalRestart(const std::string &service)
{
    LOGI("collab") << "Reconnect to selected VPN server (restart " << service << ")";
    Control_("-h", service);
}

// ---------- CommandConfigGenerator ----------

CommandConfigGenerator::CommandConfigGenerator(const Params &p)
    : p_(p)
{
    if (p_.command.empty()) throw std::invalid_argument("CommandConfigGenerator: command is empty");
    if (p_.output_path.empty()) throw std::invalid_argument("CommandConfigGenerator: output_path is empty");
}

std::string CommandConfigGenerator::Regenerate()
{
    LOGI("collab") << "Regenerate tunnel config: " << p_.command.front();

    int code = 0;
    try
    {
        code = RunProgram(p_.command);
    }
    catch (const std::exception &e)
    {
        throw ConfigRegenerationFailed(e.what());
    }
    if (code != 0)
    {
        throw ConfigRegenerationFailed(p_.command.front() + " exited with " + std::to_string(code));
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(p_.output_path, ec);
    if (ec || size == 0)
    {
        throw ConfigRegenerationFailed("config not produced at " + p_.output_path);
    }

    LOGD("collab") << "Tunnel config ready: " << p_.output_path << " (" << size << " bytes)";
    return p_.output_path;
}

// ---------- TunnelConfig ----------

namespace TunnelConfig
{
    std::vector<std::string> ReadRemotes(const std::string &path)
    {
        std::vector<std::string> out;
        std::ifstream in(path);
        if (!in) return out;

        std::string line;
        while (std::getline(in, line))
        {
            std::istringstream ls(line);
            std::string kw, host;
            if (!(ls >> kw >> host)) continue;
            if (kw != "remote") continue;
            host = PolicyInput::StripBrackets(host);
            if (std::find(out.begin(), out.end(), host) == out.end()) out.push_back(host);
        }
        return out;
    }

    std::vector<std::string> BuildLaunchArgv(const std::string &binary,
                                             const std::string &ovpn_file,
                                             const std::string &auth_file,
                                             const std::string &extra_opts)
    {
        std::vector<std::string> argv = {
            binary,
            "--config", ovpn_file,
            "--auth-user-pass", auth_file,
            "--auth-nocache"
        };

        std::istringstream es(extra_opts);
        std::string opt;
        while (es >> opt) argv.push_back(opt);
        return argv;
    }
}
