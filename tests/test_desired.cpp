#include "Core/Serve/Desired.hpp"
#include "TestObjects.hpp"

#include <gtest/gtest.h>

using namespace Serve;
using TestObjects::LbService;
using TestObjects::Slice;

namespace
{
    const std::string kNode = "n1";
    const std::string kCidr = "10.99.0.0/24";
}

TEST(Desired, ManagedLoadBalancerFilter)
{
    Settings st;
    auto svc = LbService("web", "front", 80, 8080);
    EXPECT_TRUE(IsManagedLoadBalancer(svc, st));

    svc.load_balancer_class = "other";
    EXPECT_FALSE(IsManagedLoadBalancer(svc, st));

    svc.load_balancer_class.reset();
    EXPECT_FALSE(IsManagedLoadBalancer(svc, st));

    svc = LbService("web", "front", 80, 8080);
    svc.type = "NodePort";
    EXPECT_FALSE(IsManagedLoadBalancer(svc, st));
}

TEST(Desired, EndpointLocality)
{
    Kube::Endpoint ep;
    ep.addresses = {"10.99.1.5"};
    ep.node_name = kNode;
    EXPECT_TRUE(IsEndpointOnNode(ep, kNode, kCidr));

    ep.node_name = "n2";
    EXPECT_FALSE(IsEndpointOnNode(ep, kNode, kCidr));

    ep.node_name.reset();
    EXPECT_FALSE(IsEndpointOnNode(ep, kNode, kCidr));
    ep.addresses = {"10.99.0.5"};
    EXPECT_TRUE(IsEndpointOnNode(ep, kNode, kCidr));
    EXPECT_FALSE(IsEndpointOnNode(ep, kNode, ""));
}

TEST(Desired, SingleServiceScenario)
{
    const auto desired = BuildDesiredServices(kNode, kCidr,
                                              {LbService("web", "svc-a", 80, 8080)},
                                              {Slice("web", "svc-a", "10.99.0.5", kNode)},
                                              Settings{});

    ASSERT_EQ(desired.size(), 1u);
    const auto &exp = desired.at("svc:k8s-web-svc-a");
    EXPECT_EQ(exp.config.tcp_forward.at(80), "10.99.0.5:8080");
    ASSERT_EQ(exp.local_endpoints.size(), 1u);
    EXPECT_EQ(exp.local_endpoints[0].address, "10.99.0.5");
}

TEST(Desired, RemoteOnlyServiceIsDropped)
{
    const auto desired = BuildDesiredServices(kNode, kCidr,
                                              {LbService("web", "svc-a", 80, 8080)},
                                              {Slice("web", "svc-a", "10.99.1.5", "n2")},
                                              Settings{});
    EXPECT_TRUE(desired.empty());
}

TEST(Desired, HeadlessIsDropped)
{
    auto svc = LbService("web", "svc-a", 80, 8080);
    svc.cluster_ip = "None";
    EXPECT_TRUE(BuildDesiredServices(kNode, kCidr, {svc}, {Slice("web", "svc-a", "10.99.0.5", kNode)},
                                     Settings{}).empty());
}

TEST(Desired, NamedTargetPortResolvedThroughSlice)
{
    auto svc = LbService("web", "svc-a", 443, 0);
    svc.ports[0].target_port.is_int  = false;
    svc.ports[0].target_port.str_val = "http";

    Kube::ServicePort udp;
    udp.protocol = "UDP";
    udp.port     = 53;
    udp.target_port.int_val = 53;
    svc.ports.push_back(udp);

    Kube::ServicePort unknown;
    unknown.port                = 9000;
    unknown.target_port.is_int  = false;
    unknown.target_port.str_val = "metrics";
    svc.ports.push_back(unknown);

    const auto desired = BuildDesiredServices(kNode, kCidr, {svc},
                                              {Slice("web", "svc-a", "10.99.0.5", kNode)}, Settings{});
    ASSERT_EQ(desired.size(), 1u);
    const auto &fwd = desired.begin()->second.config.tcp_forward;
    EXPECT_EQ(fwd.size(), 1u);
    EXPECT_EQ(fwd.at(443), "10.99.0.5:8080");
}

TEST(Desired, NoResolvablePortsDropsService)
{
    auto svc = LbService("web", "svc-a", 443, 0);
    svc.ports[0].target_port.is_int  = false;
    svc.ports[0].target_port.str_val = "grpc";

    EXPECT_TRUE(BuildDesiredServices(kNode, kCidr, {svc},
                                     {Slice("web", "svc-a", "10.99.0.5", kNode)}, Settings{}).empty());
}

TEST(Desired, FirstLocalEndpointWinsAndAddressesDeduplicate)
{
    auto a = Slice("web", "svc-a", "10.99.0.5", kNode);
    auto b = Slice("web", "svc-a", "10.99.0.6", kNode);
    auto dup = Slice("web", "svc-a", "10.99.0.5", kNode);

    const auto local = LocalEndpointsForService(kNode, kCidr, LbService("web", "svc-a", 80, 8080), {a, b, dup});
    ASSERT_EQ(local.size(), 2u);
    EXPECT_EQ(local[0].address, "10.99.0.5");

    const auto cfg = BuildServiceConfig(LbService("web", "svc-a", 80, 8080), local);
    EXPECT_EQ(cfg.tcp_forward.at(80), "10.99.0.5:8080");
}

TEST(Desired, SliceOfOtherNamespaceIgnored)
{
    EXPECT_TRUE(LocalEndpointsForService(kNode, kCidr, LbService("web", "svc-a", 80, 8080),
                                         {Slice("other", "svc-a", "10.99.0.5", kNode)}).empty());
}

TEST(Desired, Ipv6BackendIsBracketed)
{
    const auto cfg = BuildServiceConfig(LbService("web", "svc-a", 80, 8080),
                                        {LocalEndpoint{"fd00::5", {}}});
    EXPECT_EQ(cfg.tcp_forward.at(80), "[fd00::5]:8080");
}

TEST(Desired, AnnotatedNameAndCollision)
{
    auto a = LbService("a", "one", 80, 8080);
    auto b = LbService("b", "two", 80, 8080);
    a.annotations["podweave.io/service-name"] = "shop";
    b.annotations["podweave.io/service-name"] = "shop";

    const auto desired = BuildDesiredServices(kNode, kCidr, {a, b},
                                              {Slice("a", "one", "10.99.0.5", kNode),
                                               Slice("b", "two", "10.99.0.6", kNode)},
                                              Settings{});
    ASSERT_EQ(desired.size(), 1u);
    EXPECT_EQ(desired.at("svc:shop").ns, "b");
}
