#pragma once

/**
 * @file ConnectionSupervisor.hpp
 * @brief Машина состояний жизненного цикла туннеля.
 *
 *   INIT ──> CONNECTING ──> CONNECTED <──> DEGRADED ──> RECONNECTING ──> CONNECTING ...
 *     \__________\______________\____________\______________\──────────> FAILED
 *
 * Единственный владелец ConnectionState и единственный инициатор применения правил.
 * Остановка (stop_token) наблюдается на границах проверок и пауз.
 */

#include "Collaborators.hpp"
#include "ConnectivityProbe.hpp"
#include "FirewallRules.hpp"
#include "PolicyBuilder.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

class ConnectionSupervisor
{
public:
    struct Params
    {
        std::vector<std::string>  probe_urls;
        int                       max_attempts     = 5;
        std::chrono::milliseconds attempt_interval = std::chrono::seconds(10);
        std::chrono::milliseconds check_interval   = std::chrono::seconds(60);
        std::string               tunnel_service   = "nordvpnd";
    };

    struct Collaborators
    {
        PolicyBuilder     &builder;
        FirewallRules     &firewall;
        ConnectivityProbe &probe;
        ProcessSupervisor &processes;
        ConfigGenerator   &generator;
        SleepFn            sleep;
    };

    using PolicySource = std::function<Policy()>;
    using Materialize  = std::function<void()>;
    using TransitionFn = std::function<void(ConnectionState from, ConnectionState to)>;

public:
    /**
     * @param policy_source Вызывается на каждый цикл применения (политика разбирается заново).
     * @param materialize Запись учётных данных в INIT и при каждом RECONNECTING; может быть пустой.
     */
    ConnectionSupervisor(const Params  &params,
                         Collaborators  collaborators,
                         PolicySource   policy_source,
                         Materialize    materialize = {});

    ConnectionSupervisor(const ConnectionSupervisor&)            = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /**
     * @brief Выполнить работу текущего состояния и не более одного перехода.
     * @return Состояние после шага. При остановке - прежнее состояние.
     */
    ConnectionState Step(std::stop_token st);

    /**
     * @brief Step() до FAILED или остановки.
     */
    ConnectionState Run(std::stop_token st);

    // Потокобезопасно: пересобрать и применить политику на ближайшей границе цикла.
    void RequestReapply();

    void OnTransition(TransitionFn fn);

    ConnectionState State() const;
    int             ConsecutiveFailures() const;

private:
    void StepInit_();
    void StepConnecting_(std::stop_token st);
    void StepConnected_(std::stop_token st);
    void StepDegraded_(std::stop_token st);
    void StepReconnecting_();

    bool ProbeOnce_(std::stop_token st);
    void ApplyPolicy_();
    void Transition_(ConnectionState to, const std::string &why);

private:
    Params        p_;
    Collaborators c_;
    PolicySource  policy_source_;
    Materialize   materialize_;
    TransitionFn  on_transition_;

    std::atomic<ConnectionState> state_{ConnectionState::Init};
    std::atomic<bool>            reapply_requested_{false};

    int         failures_     = 0;
    bool        started_      = false;
    std::string config_path_;
};
