#include "Core/Net/FirewallRules.hpp"
#include "Fakes.hpp"

#include <gtest/gtest.h>

namespace
{
    FirewallRules::Params BaseParams()
    {
        FirewallRules::Params p;
        p.pod_cidr = "10.99.3.0/24";
        return p;
    }
}

TEST(FirewallRules, MasqueradeOnly)
{
    const std::string script = FirewallRules::BuildRuleset(BaseParams());

    EXPECT_EQ(script,
              "add table ip podweave\n"
              "delete table ip podweave\n"
              "add table ip podweave\n"
              "add chain ip podweave masq { type nat hook postrouting priority 99; policy accept; }\n"
              "add rule ip podweave masq ip saddr 10.99.3.0/24 oifname != \"cni0\" oifname != \"tailscale0\""
              " counter masquerade\n");
}

TEST(FirewallRules, MetadataRedirect)
{
    auto p = BaseParams();
    p.metadata_port = 4160;
    const std::string script = FirewallRules::BuildRuleset(p);

    EXPECT_NE(script.find("add chain ip podweave metadata-redirect { type nat hook prerouting priority -100;"),
              std::string::npos);
    EXPECT_NE(script.find("ip daddr 169.254.169.253 tcp dport 80 ip saddr 10.99.3.0/24 counter dnat to 127.0.0.1:4160"),
              std::string::npos);
}

TEST(FirewallRules, PureFunctionOfInputs)
{
    auto p = BaseParams();
    EXPECT_EQ(FirewallRules::BuildRuleset(p), FirewallRules::BuildRuleset(p));

    auto q = p;
    q.bridge_ifname = "br0";
    EXPECT_NE(FirewallRules::BuildRuleset(p), FirewallRules::BuildRuleset(q));

    auto r = p;
    r.metadata_port = 80;
    EXPECT_NE(FirewallRules::BuildRuleset(p), FirewallRules::BuildRuleset(r));
}

TEST(FirewallRules, HostBitsAreMasked)
{
    auto p = BaseParams();
    p.pod_cidr = "10.99.3.17/24";
    EXPECT_NE(FirewallRules::BuildRuleset(p).find("ip saddr 10.99.3.0/24"), std::string::npos);
}

TEST(FirewallRules, RejectsBadInput)
{
    auto p = BaseParams();
    p.pod_cidr = "fd00::/64";
    EXPECT_THROW(FirewallRules::BuildRuleset(p), std::invalid_argument);

    p = BaseParams();
    p.pod_cidr = "garbage";
    EXPECT_THROW(FirewallRules::BuildRuleset(p), std::invalid_argument);

    p = BaseParams();
    p.bridge_ifname = "cni0\"; flush ruleset";
    EXPECT_THROW(FirewallRules::BuildRuleset(p), std::invalid_argument);

    p = BaseParams();
    p.overlay_ifname = "";
    EXPECT_THROW(FirewallRules::BuildRuleset(p), std::invalid_argument);

    p = BaseParams();
    p.metadata_port = 0;
    EXPECT_THROW(FirewallRules::BuildRuleset(p), std::invalid_argument);
}

TEST(FirewallRules, ReconcileRunsOneScript)
{
    auto exec = std::make_unique<Fakes::NftExecutor>();
    auto *raw = exec.get();
    FirewallRules fw(std::move(exec));

    fw.Reconcile(BaseParams());
    fw.Reconcile(BaseParams());

    ASSERT_EQ(raw->scripts.size(), 2u);
    EXPECT_EQ(raw->scripts[0], raw->scripts[1]);
}

TEST(FirewallRules, ReconcileFailureThrows)
{
    auto exec = std::make_unique<Fakes::NftExecutor>();
    exec->fail = true;
    FirewallRules fw(std::move(exec));

    EXPECT_THROW(fw.Reconcile(BaseParams()), std::runtime_error);
}

TEST(FirewallRules, BadInputNeverReachesExecutor)
{
    auto exec = std::make_unique<Fakes::NftExecutor>();
    auto *raw = exec.get();
    FirewallRules fw(std::move(exec));

    auto p = BaseParams();
    p.pod_cidr = "";
    EXPECT_THROW(fw.Reconcile(p), std::invalid_argument);
    EXPECT_TRUE(raw->scripts.empty());
}
