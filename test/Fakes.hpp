#pragma once

// Подставные реализации швов движка для тестов.

#include "Core/Warden/AddressResolver.hpp"
#include "Core/Warden/Collaborators.hpp"
#include "Core/Warden/ConnectivityProbe.hpp"
#include "Core/Warden/Errors.hpp"
#include "Core/Warden/FirewallRules.hpp"
#include "Core/Warden/PolicyInput.hpp"

#include <chrono>
#include <deque>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Имя -> адреса; неизвестное имя -> ResolutionFailed. Литералы проходят как есть.
class FakeResolver : public AddressResolver {
public:
    std::map<std::string, std::set<Destination>> answers;
    std::vector<std::string> asked;

    std::set<Destination> Resolve(const BypassEntry &entry) override {
        asked.push_back(entry.raw);
        if (const auto lit = PolicyInput::ParseLiteral(entry.raw)) {
            return {*lit};
        }
        auto it = answers.find(entry.raw);
        if (it == answers.end()) {
            throw ResolutionFailed(entry.raw + ": NXDOMAIN");
        }
        return it->second;
    }
};

// Интерпретирует транзакции nft над таблицами в памяти: либо вся транзакция, либо ничего.
class FakeFirewallBackend : public FirewallBackend {
public:
    // "ip warden" -> правила ("oifname \"eth0\" ip daddr 1.2.3.4 accept")
    std::map<std::string, std::vector<std::string>> tables;
    std::set<std::string> interfaces = {"lo", "eth0"};
    bool fail_v4 = false;
    bool fail_v6 = false;
    bool v6_supported = true;
    std::vector<std::string> scripts;

    void Run(const std::string &script) override {
        scripts.push_back(script);
        const bool is_v6 = script.find(" ip6 ") != std::string::npos;
        if ((is_v6 && fail_v6) || (!is_v6 && fail_v4)) {
            throw std::runtime_error("Error: Could not process rule: Operation not permitted");
        }

        auto next = tables;
        std::istringstream in(script);
        std::string line;
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            std::istringstream ls(line);
            std::string verb, object, family, table;
            ls >> verb >> object >> family >> table;
            const std::string key = family + " " + table;
            if (verb == "add" && object == "table") {
                next[key];
            } else if (verb == "delete" && object == "table") {
                if (next.erase(key) == 0) {
                    throw std::runtime_error("Error: No such file or directory; delete table " + key);
                }
            } else if (verb == "add" && object == "chain") {
                if (!next.count(key)) throw std::runtime_error("no table " + key);
            } else if (verb == "add" && object == "rule") {
                auto it = next.find(key);
                if (it == next.end()) throw std::runtime_error("no table " + key);
                std::string chain;
                ls >> chain;
                std::string rest;
                std::getline(ls, rest);
                it->second.push_back(rest.substr(rest.find_first_not_of(' ')));
            } else {
                throw std::runtime_error("unexpected command: " + line);
            }
        }
        tables = std::move(next);
    }

    bool InterfaceExists(const std::string &ifname) override {
        return interfaces.count(ifname) != 0;
    }

    bool FamilySupported(IpFamily family) override {
        return family == IpFamily::V4 || v6_supported;
    }
};

// Ответы по очереди; пустая очередь -> fallback. -1 -> транспортная ошибка.
class ScriptedChecker : public HttpChecker {
public:
    std::deque<int> statuses;
    int fallback = 204;
    std::vector<std::string> requested;

    int Head(const std::string &url, std::chrono::milliseconds) override {
        requested.push_back(url);
        int status = fallback;
        if (!statuses.empty()) {
            status = statuses.front();
            statuses.pop_front();
        }
        if (status < 0) {
            throw ProbeTransportError("connect: Connection refused");
        }
        return status;
    }
};

class FakeProcesses : public ProcessSupervisor {
public:
    std::vector<std::string> calls;
    bool fail_restart = false;

    void Start(const std::string &service) override {
        calls.push_back("start " + service);
    }
    void SignalRestart(const std::string &service) override {
        calls.push_back("restart " + service);
        if (fail_restart) throw std::runtime_error("s6-svc exited with 111");
    }
};

class FakeGenerator : public ConfigGenerator {
public:
    std::string path = "/nonexistent/warden-test.ovpn";
    int calls = 0;
    int fail_from_call = 0;  // 0 - никогда

    std::string Regenerate() override {
        ++calls;
        if (fail_from_call != 0 && calls >= fail_from_call) {
            throw ConfigRegenerationFailed("createvpnconfig.sh exited with 1");
        }
        return path;
    }
};

// Пауза без ожидания; запоминает запрошенные длительности.
struct RecordingSleep {
    std::vector<std::chrono::milliseconds> *log;

    bool operator()(std::chrono::milliseconds d, std::stop_token st) const {
        log->push_back(d);
        return !st.stop_requested();
    }
};
