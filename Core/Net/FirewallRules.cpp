#include "Core/Net/FirewallRules.hpp"
#include "Core/Net/Network.hpp"
#include "Core/Logger.hpp"

#include <sstream>
#include <stdexcept>

#include <net/if.h>
#include <nftables/libnftables.h>

namespace
{
    void ValidateIfname(const std::string &name,
                        const char        *what)
    {
        if (name.empty() || name.size() >= IFNAMSIZ)
        {
            throw std::invalid_argument(std::string("firewall: bad ") + what + " name '" + name + "'");
        }
        for (unsigned char c : name)
        {
            if (c <= ' ' || c == '"' || c == '\\' || c == ';' || c >= 0x7f)
            {
                throw std::invalid_argument(std::string("firewall: bad ") + what + " name '" + name + "'");
            }
        }
    }
}

LibNftExecutor::LibNftExecutor()
{
    ctx_ = nft_ctx_new(NFT_CTX_DEFAULT);
    if (!ctx_)
    {
        throw std::runtime_error("libnftables: nft_ctx_new failed");
    }
    nft_ctx_buffer_output(ctx_);
    nft_ctx_buffer_error(ctx_);
}

LibNftExecutor::~LibNftExecutor()
{
    if (ctx_)
    {
        nft_ctx_free(ctx_);
    }
}

bool LibNftExecutor::Run(const std::string &script,
                         std::string       &error)
{
    const int rc = nft_run_cmd_from_buffer(ctx_, script.c_str());
    if (rc != 0)
    {
        const char *err = nft_ctx_get_error_buffer(ctx_);
        error = (err && *err) ? err : "nft_run_cmd_from_buffer rc=" + std::to_string(rc);
        return false;
    }
    return true;
}

FirewallRules::FirewallRules(std::unique_ptr<NftExecutor> executor)
    : executor_(std::move(executor))
{
    if (!executor_)
    {
        throw std::invalid_argument("FirewallRules: executor is null");
    }
}

std::string FirewallRules::BuildRuleset(const Params &p)
{
    NetConfig::CidrV4 c{};
    if (p.pod_cidr.find(':') != std::string::npos || !NetConfig::parse_cidr4(p.pod_cidr, c))
    {
        throw std::invalid_argument("firewall: pod subnet must be IPv4 CIDR, got '" + p.pod_cidr + "'");
    }
    ValidateIfname(p.bridge_ifname,  "bridge");
    ValidateIfname(p.overlay_ifname, "overlay");

    const std::string net = NetConfig::to_network_cidr(c);
    const std::string t   = std::string("ip ") + kTableName;

    std::ostringstream s;
    // add+delete в одной транзакции: удаление не падает, если таблицы ещё нет.
    s << "add table " << t << "\n";
    s << "delete table " << t << "\n";
    s << "add table " << t << "\n";

    s << "add chain " << t << " " << kMasqChain
      << " { type nat hook postrouting priority 99; policy accept; }\n";
    s << "add rule " << t << " " << kMasqChain
      << " ip saddr " << net
      << " oifname != \"" << p.bridge_ifname << "\""
      << " oifname != \"" << p.overlay_ifname << "\""
      << " counter masquerade\n";

    if (p.metadata_port)
    {
        if (*p.metadata_port == 0)
        {
            throw std::invalid_argument("firewall: metadata port must be non-zero");
        }
        s << "add chain " << t << " " << kRedirectChain
          << " { type nat hook prerouting priority -100; policy accept; }\n";
        s << "add rule " << t << " " << kRedirectChain
          << " ip daddr " << kMetadataAddress << " tcp dport 80"
          << " ip saddr " << net
          << " counter dnat to 127.0.0.1:" << *p.metadata_port << "\n";
    }
    return s.str();
}

void FirewallRules::Reconcile(const Params &params)
{
    const std::string script = BuildRuleset(params);

    LOGI("firewall") << "Reconcile: table=" << kTableName
                     << " subnet=" << params.pod_cidr
                     << " bridge=" << params.bridge_ifname
                     << " overlay=" << params.overlay_ifname
                     << " metadata=" << (params.metadata_port ? std::to_string(*params.metadata_port) : "off");
    LOGT("firewall") << "Reconcile: script:\n" << script;

    std::string error;
    if (!executor_->Run(script, error))
    {
        LOGE("firewall") << "Reconcile: nft failed: " << error;
        throw std::runtime_error("firewall: nft rejected ruleset: " + error);
    }
}
