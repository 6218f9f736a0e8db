#include "PolicyBuilder.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

PolicyBuilder::PolicyBuilder(AddressResolver &resolver)
    : resolver_(resolver)
{
}

std::vector<ResolvedTarget> PolicyBuilder::ResolveAll_(const std::vector<BypassEntry> &entries,
                                                       const char                     *what,
                                                       std::vector<std::string>       &warnings) const
{
    std::vector<ResolvedTarget> out;
    out.reserve(entries.size());

    for (const BypassEntry &e : entries)
    {
        ResolvedTarget t{e, {}};
        try
        {
            t.addresses = resolver_.Resolve(e);
        }
        catch (const ResolutionFailed &ex)
        {
            LOGW("policy") << what << " entry '" << e.raw << "' omitted this cycle: " << ex.what();
            warnings.push_back(std::string(what) + " " + e.raw + ": " + ex.what());
        }
        catch (const std::exception &ex)
        {
            LOGW("policy") << what << " entry '" << e.raw << "' resolver error: " << ex.what();
            warnings.push_back(std::string(what) + " " + e.raw + ": " + ex.what());
        }
        out.push_back(std::move(t));
    }
    return out;
}

PolicyBuilder::Result PolicyBuilder::Build(const Policy &policy) const
{
    Result res;

    const auto bypass = ResolveAll_(policy.bypass_entries, "bypass", res.warnings);
    const auto api    = ResolveAll_(policy.api_allowlist, "allowlist", res.warnings);

    for (IpFamily family : { IpFamily::V4, IpFamily::V6 })
    {
        for (const ResolvedTarget &t : bypass)
        {
            for (const Destination &d : t.addresses)
            {
                if (d.family != family) continue;
                res.rules.push_back(Rule{family, RuleAction::Accept, {policy.outbound_iface, d.text}});
            }
        }

        // allowlist - всегда, даже при kill switch: иначе не сможем подтянуть конфиг
        for (const ResolvedTarget &t : api)
        {
            for (const Destination &d : t.addresses)
            {
                if (d.family != family) continue;
                res.rules.push_back(Rule{family, RuleAction::Accept, {std::nullopt, d.text}});
            }
        }

        if (policy.kill_switch)
        {
            res.rules.push_back(Rule{family, RuleAction::Drop, {policy.outbound_iface, std::nullopt}});
        }
    }

    LOGD("policy") << "Build: bypass=" << policy.bypass_entries.size()
                   << " allowlist=" << policy.api_allowlist.size()
                   << " killswitch=" << (policy.kill_switch ? "1" : "0")
                   << " iface=" << policy.outbound_iface
                   << " rules=" << res.rules.size()
                   << " warnings=" << res.warnings.size();
    return res;
}
