#include "ConnectionSupervisor.hpp"
#include "Errors.hpp"
#include "PolicyInput.hpp"
#include "Core/Logger.hpp"

#include <algorithm>

ConnectionSupervisor::ConnectionSupervisor(const Params  &params,
                                           Collaborators  collaborators,
                                           PolicySource   policy_source,
                                           Materialize    materialize)
    : p_(params)
    , c_(std::move(collaborators))
    , policy_source_(std::move(policy_source))
    , materialize_(std::move(materialize))
{
    if (p_.probe_urls.empty()) throw std::invalid_argument("ConnectionSupervisor: probe_urls is empty");
    if (p_.max_attempts < 1)   throw std::invalid_argument("ConnectionSupervisor: max_attempts must be >= 1");
    if (!policy_source_)       throw std::invalid_argument("ConnectionSupervisor: policy_source is empty");
    if (!c_.sleep)             throw std::invalid_argument("ConnectionSupervisor: sleep is empty");
}

ConnectionState ConnectionSupervisor::State() const
{
    return state_.load();
}

int ConnectionSupervisor::ConsecutiveFailures() const
{
    return failures_;
}

void ConnectionSupervisor::RequestReapply()
{
    reapply_requested_.store(true);
}

void ConnectionSupervisor::OnTransition(TransitionFn fn)
{
    on_transition_ = std::move(fn);
}

void ConnectionSupervisor::Transition_(ConnectionState to, const std::string &why)
{
    const ConnectionState from = state_.exchange(to);
    if (to == ConnectionState::Failed)
        LOGE("supervisor") << "State: " << ToString(from) << " -> " << ToString(to) << " (" << why << ")";
    else
        LOGI("supervisor") << "State: " << ToString(from) << " -> " << ToString(to) << " (" << why << ")";

    if (on_transition_) on_transition_(from, to);
}

void ConnectionSupervisor::ApplyPolicy_()
{
    Policy policy = policy_source_();

    // сервер туннеля должен быть доступен и при kill switch
    for (const std::string &host : TunnelConfig::ReadRemotes(config_path_))
    {
        auto entry = PolicyInput::Normalize(host);
        if (!entry) continue;
        if (std::find(policy.api_allowlist.begin(), policy.api_allowlist.end(), *entry) != policy.api_allowlist.end())
            continue;
        LOGD("supervisor") << "Tunnel remote allowed: " << entry->raw;
        policy.api_allowlist.push_back(std::move(*entry));
    }

    const PolicyBuilder::Result built = c_.builder.Build(policy);
    const FirewallRules::Report report = c_.firewall.Apply(built.rules, policy.outbound_iface);

    LOGI("supervisor") << "Policy applied: rules=" << built.rules.size()
                       << " resolution_warnings=" << built.warnings.size()
                       << " firewall_warnings=" << report.warnings.size();
}

bool ConnectionSupervisor::ProbeOnce_(std::stop_token st)
{
    return c_.probe.Check(p_.probe_urls, 1, std::chrono::milliseconds(0), st);
}

// ---------- states ----------

void ConnectionSupervisor::StepInit_()
{
    try
    {
        if (materialize_) materialize_();
        config_path_ = c_.generator.Regenerate();
        ApplyPolicy_();
    }
    catch (const ConfigRegenerationFailed &e)
    {
        Transition_(ConnectionState::Failed, std::string("config regeneration failed: ") + e.what());
        return;
    }
    catch (const RuleApplyFailed &e)
    {
        Transition_(ConnectionState::Failed, std::string("policy apply failed: ") + e.what());
        return;
    }
    catch (const std::exception &e)
    {
        Transition_(ConnectionState::Failed, std::string("bootstrap failed: ") + e.what());
        return;
    }

    Transition_(ConnectionState::Connecting, "credentials, config and policy in place");
}

void ConnectionSupervisor::StepConnecting_(std::stop_token st)
{
    if (!started_)
    {
        try
        {
            c_.processes.Start(p_.tunnel_service);
        }
        catch (const std::exception &e)
        {
            Transition_(ConnectionState::Failed, std::string("cannot start tunnel service: ") + e.what());
            return;
        }
        started_ = true;
    }

    const bool up = c_.probe.Check(p_.probe_urls, p_.max_attempts, p_.attempt_interval, st);
    if (st.stop_requested()) return;

    if (up)
    {
        failures_ = 0;
        Transition_(ConnectionState::Connected, "first probe succeeded");
    }
    else
    {
        Transition_(ConnectionState::Reconnecting, "tunnel did not come up");
    }
}

void ConnectionSupervisor::StepConnected_(std::stop_token st)
{
    if (!c_.sleep(p_.check_interval, st)) return;

    if (reapply_requested_.exchange(false))
    {
        LOGI("supervisor") << "Network changed, reapplying policy";
        try
        {
            ApplyPolicy_();
        }
        catch (const RuleApplyFailed &e)
        {
            Transition_(ConnectionState::Failed, std::string("policy reapply failed: ") + e.what());
            return;
        }
    }

    if (ProbeOnce_(st)) return;
    if (st.stop_requested()) return;

    failures_ = 1;
    LOGW("supervisor") << "Probe failed (" << failures_ << "/" << p_.max_attempts << ")";
    Transition_(ConnectionState::Degraded, "periodic probe failed");
}

void ConnectionSupervisor::StepDegraded_(std::stop_token st)
{
    if (failures_ >= p_.max_attempts)
    {
        Transition_(ConnectionState::Reconnecting, "retry budget exhausted");
        return;
    }

    if (!c_.sleep(p_.attempt_interval, st)) return;

    if (ProbeOnce_(st))
    {
        failures_ = 0;
        Transition_(ConnectionState::Connected, "probe recovered");
        return;
    }
    if (st.stop_requested()) return;

    ++failures_;
    LOGW("supervisor") << "Probe failed (" << failures_ << "/" << p_.max_attempts << ")";
    if (failures_ >= p_.max_attempts)
    {
        Transition_(ConnectionState::Reconnecting, "retry budget exhausted");
    }
}

void ConnectionSupervisor::StepReconnecting_()
{
    LOGW("supervisor") << "Connection via VPN is down, recreate VPN";
    try
    {
        // учётные данные могли смениться вместе с конфигом
        if (materialize_) materialize_();
        config_path_ = c_.generator.Regenerate();
        ApplyPolicy_();
        c_.processes.SignalRestart(p_.tunnel_service);
    }
    catch (const ConfigRegenerationFailed &e)
    {
        Transition_(ConnectionState::Failed, std::string("config regeneration failed: ") + e.what());
        return;
    }
    catch (const RuleApplyFailed &e)
    {
        Transition_(ConnectionState::Failed, std::string("policy apply failed: ") + e.what());
        return;
    }
    catch (const std::exception &e)
    {
        Transition_(ConnectionState::Failed, std::string("tunnel restart failed: ") + e.what());
        return;
    }

    failures_ = 0;
    started_  = true;
    Transition_(ConnectionState::Connecting, "tunnel service restarted");
}

ConnectionState ConnectionSupervisor::Step(std::stop_token st)
{
    if (st.stop_requested()) return state_.load();

    switch (state_.load())
    {
        case ConnectionState::Init:         StepInit_();          break;
        case ConnectionState::Connecting:   StepConnecting_(st);  break;
        case ConnectionState::Connected:    StepConnected_(st);   break;
        case ConnectionState::Degraded:     StepDegraded_(st);    break;
        case ConnectionState::Reconnecting: StepReconnecting_();  break;
        case ConnectionState::Failed:                             break;
    }
    return state_.load();
}

ConnectionState ConnectionSupervisor::Run(std::stop_token st)
{
    LOGI("supervisor") << "Run: service=" << p_.tunnel_service
                       << " attempts=" << p_.max_attempts
                       << " interval=" << p_.attempt_interval.count() << "ms"
                       << " check=" << p_.check_interval.count() << "ms"
                       << " urls=" << p_.probe_urls.size();

    while (!st.stop_requested())
    {
        if (Step(st) == ConnectionState::Failed) break;
    }

    LOGI("supervisor") << "Run: exit in " << ToString(state_.load());
    return state_.load();
}
