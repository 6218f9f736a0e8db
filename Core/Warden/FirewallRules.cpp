#include "FirewallRules.hpp"
#include "Errors.hpp"
#include "Core/Logger.hpp"

#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <nftables/libnftables.h>
#include <netlink/netlink.h>
#include <netlink/cache.h>
#include <netlink/route/link.h>

namespace {
    struct NlSock {
        nl_sock *sk {nullptr};
        NlSock() {
            sk = nl_socket_alloc();
            if (!sk) throw std::runtime_error("nl_socket_alloc failed");
            int rc = nl_connect(sk, NETLINK_ROUTE);
            if (rc < 0) { std::string msg = std::string("nl_connect: ")+nl_geterror(rc);
                nl_socket_free(sk); sk=nullptr; throw std::runtime_error(msg); }
        }
        ~NlSock(){ if (sk) nl_socket_free(sk); }
        NlSock(const NlSock&)=delete; NlSock& operator=(const NlSock&)=delete;
    };

    const char *NftFamily(IpFamily f) { return f == IpFamily::V4 ? "ip" : "ip6"; }
    const char *DaddrKw(IpFamily f)   { return f == IpFamily::V4 ? "ip daddr" : "ip6 daddr"; }
}

// ---------- NftBackend ----------

NftBackend::NftBackend()
{
    ctx_ = nft_ctx_new(NFT_CTX_DEFAULT);
    if (!ctx_) throw std::runtime_error("libnftables: nft_ctx_new failed");
    nft_ctx_buffer_error(ctx_);
}

NftBackend::~NftBackend()
{
    if (ctx_) { nft_ctx_free(ctx_); ctx_ = nullptr; }
}

void NftBackend::Run(const std::string &script)
{
    const int rc = nft_run_cmd_from_buffer(ctx_, script.c_str());
    if (rc != 0)
    {
        std::string err;
        if (const char *e = nft_ctx_get_error_buffer(ctx_)) err = e;
        while (!err.empty() && (err.back() == '\n' || err.back() == ' ')) err.pop_back();
        LOGT("firewall") << "nft failed:\n" << script;
        throw std::runtime_error("libnftables: " + (err.empty() ? std::string("command failed") : err));
    }
    LOGT("firewall") << "nft ok:\n" << script;
}

bool NftBackend::InterfaceExists(const std::string &ifname)
{
    NlSock nl;
    nl_cache *lcache = nullptr;
    const int rc = rtnl_link_alloc_cache(nl.sk, AF_UNSPEC, &lcache);
    if (rc < 0) throw std::runtime_error(std::string("rtnl_link_alloc_cache: ") + nl_geterror(rc));

    rtnl_link *lnk = rtnl_link_get_by_name(lcache, ifname.c_str());
    const bool found = (lnk != nullptr);
    if (lnk) rtnl_link_put(lnk);
    nl_cache_free(lcache);
    return found;
}

bool NftBackend::FamilySupported(IpFamily family)
{
    if (family == IpFamily::V4) return true;
    std::error_code ec;
    return std::filesystem::exists("/proc/sys/net/ipv6", ec);
}

// ---------- FirewallRules ----------

FirewallRules::FirewallRules(const Params &params, FirewallBackend &backend)
    : p_(params)
    , backend_(backend)
{
    if (p_.table_name.empty()) throw std::invalid_argument("FirewallRules: table_name is empty");
    if (p_.chain_name.empty()) throw std::invalid_argument("FirewallRules: chain_name is empty");
}

std::string FirewallRules::RenderRule_(const Params &params, const Rule &rule)
{
    std::string s = "add rule ";
    s += NftFamily(rule.family);
    s += " " + params.table_name + " " + params.chain_name;
    if (rule.match.iface) s += " oifname \"" + *rule.match.iface + "\"";
    if (rule.match.dest)  s += std::string(" ") + DaddrKw(rule.family) + " " + *rule.match.dest;
    s += rule.action == RuleAction::Accept ? " accept" : " drop";
    return s;
}

std::string FirewallRules::Render(const Params &params, IpFamily family, const RuleSet &rules)
{
    const std::string fam   = NftFamily(family);
    const std::string table = fam + " " + params.table_name;

    std::ostringstream s;
    // add+delete: delete не падает, если таблицы ещё нет; всё - одна транзакция
    s << "add table " << table << "\n";
    s << "delete table " << table << "\n";
    s << "add table " << table << "\n";
    // policy accept - решение о запрете принимает только правило kill switch
    s << "add chain " << table << " " << params.chain_name
      << " { type filter hook output priority " << params.hook_priority << "; policy accept; }\n";
    for (const Rule &r : rules)
    {
        if (r.family != family) continue;
        s << RenderRule_(params, r) << "\n";
    }
    return s.str();
}

FirewallRules::Report FirewallRules::Apply(const RuleSet &rules, const std::string &outbound_iface)
{
    std::lock_guard<std::mutex> lk(mu_);

    Report rep;
    rep.v4_rules = RulesForFamily(rules, IpFamily::V4).size();
    rep.v6_rules = RulesForFamily(rules, IpFamily::V6).size();

    LOGI("firewall") << "Apply: table=" << p_.table_name << " chain=" << p_.chain_name
                     << " iface=" << outbound_iface
                     << " v4=" << rep.v4_rules << " v6=" << rep.v6_rules;

    bool iface_ok = false;
    try
    {
        iface_ok = backend_.InterfaceExists(outbound_iface);
    }
    catch (const std::exception &e)
    {
        throw RuleApplyFailed(IpFamily::V4, std::string("interface lookup failed: ") + e.what());
    }
    if (!iface_ok)
    {
        LOGE("firewall") << "Outbound interface not present: " << outbound_iface;
        throw RuleApplyFailed(IpFamily::V4, "interface not present: " + outbound_iface);
    }

    try
    {
        backend_.Run(Render(p_, IpFamily::V4, rules));
    }
    catch (const std::exception &e)
    {
        LOGE("firewall") << "IPv4 apply failed: " << e.what();
        throw RuleApplyFailed(IpFamily::V4, e.what());
    }
    applied_v4_   = true;
    rep.v4_applied = true;

    if (!backend_.FamilySupported(IpFamily::V6))
    {
        LOGW("firewall") << "IPv6 stack not present; IPv6 rules skipped";
        rep.warnings.emplace_back("IPv6 stack not present");
    }
    else
    {
        try
        {
            backend_.Run(Render(p_, IpFamily::V6, rules));
            applied_v6_    = true;
            rep.v6_applied = true;
        }
        catch (const std::exception &e)
        {
            LOGW("firewall") << "IPv6 apply failed (tolerated): " << e.what();
            rep.warnings.emplace_back(std::string("IPv6: ") + e.what());
        }
    }

    LOGI("firewall") << "Firewall rules applied (v4=" << (rep.v4_applied ? "ok" : "-")
                     << " v6=" << (rep.v6_applied ? "ok" : "skipped") << ")";
    return rep;
}

void FirewallRules::Revert()
{
    std::lock_guard<std::mutex> lk(mu_);
    for (IpFamily family : { IpFamily::V4, IpFamily::V6 })
    {
        try
        {
            backend_.Run(std::string("delete table ") + NftFamily(family) + " " + p_.table_name + "\n");
            LOGI("firewall") << "Firewall rules reverted (" << ToString(family) << ")";
        }
        catch (const std::exception &e)
        {
            LOGD("firewall") << "No " << ToString(family) << " table to delete: " << e.what();
        }
    }
    applied_v4_ = false;
    applied_v6_ = false;
}

bool FirewallRules::Applied() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return applied_v4_;
}
