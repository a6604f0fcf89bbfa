#include "Core/Agent/Controller.hpp"
#include "Core/Agent/PeerRoutes.hpp"
#include "Core/Net/RouteSync.hpp"
#include "Fakes.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace
{
    constexpr const char *kVia = "100.64.0.1";

    bool WaitFor(const std::function<bool()> &pred)
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    struct SelfLog
    {
        std::mutex                                       mu;
        std::vector<std::pair<std::string, std::string>> calls;
        bool                                             fail = false;

        void Apply(const std::string &subnet,
                   const std::string &previous)
        {
            std::lock_guard<std::mutex> lk(mu);
            calls.emplace_back(subnet, previous);
            if (fail) throw std::runtime_error("apply failed");
        }

        std::size_t Count()
        {
            std::lock_guard<std::mutex> lk(mu);
            return calls.size();
        }

        std::pair<std::string, std::string> Last()
        {
            std::lock_guard<std::mutex> lk(mu);
            return calls.back();
        }
    };

    Agent::Controller::Settings Settings(bool watch_pods = false)
    {
        Agent::Controller::Settings s;
        s.node_name  = "n1";
        s.resync     = std::chrono::seconds(0);
        s.watch_pods = watch_pods;
        return s;
    }

    class ControllerTest : public ::testing::Test
    {
    protected:
        ControllerTest()
            : routes_(backend_)
        {
        }

        Agent::Controller::Hooks Hooks(bool with_services)
        {
            Agent::Controller::Hooks h;
            h.apply_self = [this](const std::string &s, const std::string &p) { self_.Apply(s, p); };
            h.sync_routes = [this](const std::vector<Kube::Node> &nodes)
            {
                routes_.EnsureRoutes(Agent::DesiredPeerRoutes("n1", nodes, kVia));
            };
            if (with_services)
            {
                h.sync_services = [this](const std::optional<Kube::Node>        &self,
                                         const std::vector<Kube::Service>       &services,
                                         const std::vector<Kube::EndpointSlice> &)
                {
                    std::lock_guard<std::mutex> lk(svc_mu_);
                    ++svc_calls_;
                    svc_seen_self_ = self.has_value();
                    svc_count_     = services.size();
                };
            }
            return h;
        }

        int ServiceCalls()
        {
            std::lock_guard<std::mutex> lk(svc_mu_);
            return svc_calls_;
        }

        std::size_t ServiceCount()
        {
            std::lock_guard<std::mutex> lk(svc_mu_);
            return svc_count_;
        }

        Fakes::KubeApi      api_;
        Fakes::RouteBackend backend_;
        Routes::RouteSync   routes_;
        SelfLog             self_;

        std::mutex  svc_mu_;
        int         svc_calls_     = 0;
        bool        svc_seen_self_ = false;
        std::size_t svc_count_     = 0;
    };

    using RouteMap = Routes::RouteSync::RouteMap;
}

TEST_F(ControllerTest, AppliesSelfAndRoutesAfterSync)
{
    boost::json::array nodes;
    nodes.push_back(Fakes::NodeJson("n1", "10.99.0.0/24"));
    nodes.push_back(Fakes::NodeJson("n2", "10.99.1.0/24"));
    api_.SetList(Kube::Paths::kNodes, Fakes::ListJson(std::move(nodes)));

    Agent::Controller controller(api_, Settings(), Hooks(false));
    controller.Start();

    ASSERT_TRUE(WaitFor([&] { return controller.Synced() && controller.LastApplied() == "10.99.0.0/24"; }));
    ASSERT_TRUE(WaitFor([&] { return routes_.Applied() == RouteMap{{"10.99.1.0/24", kVia}}; }));
    EXPECT_EQ(self_.Last(), std::make_pair(std::string("10.99.0.0/24"), std::string()));

    // Своё обновление без смены подсети, затем смена подсети соседа.
    api_.Push(Kube::Paths::kNodes, "MODIFIED", Fakes::NodeJson("n1", "10.99.0.0/24", "11"));
    api_.Push(Kube::Paths::kNodes, "MODIFIED", Fakes::NodeJson("n2", "10.99.5.0/24", "11"));
    EXPECT_TRUE(WaitFor([&] { return routes_.Applied() == RouteMap{{"10.99.5.0/24", kVia}}; }));
    EXPECT_EQ(self_.Count(), 1u);

    // Новый узел.
    api_.Push(Kube::Paths::kNodes, "ADDED", Fakes::NodeJson("n3", "10.99.6.0/24", "12"));
    EXPECT_TRUE(WaitFor([&] { return routes_.Applied().count("10.99.6.0/24") == 1; }));

    // Сосед удалён.
    api_.Push(Kube::Paths::kNodes, "DELETED", Fakes::NodeJson("n2", "10.99.5.0/24", "13"));
    EXPECT_TRUE(WaitFor([&] { return routes_.Applied() == RouteMap{{"10.99.6.0/24", kVia}}; }));

    // Своя подсеть сменилась.
    api_.Push(Kube::Paths::kNodes, "MODIFIED", Fakes::NodeJson("n1", "10.99.7.0/24", "14"));
    EXPECT_TRUE(WaitFor([&] { return controller.LastApplied() == "10.99.7.0/24"; }));
    EXPECT_EQ(self_.Last(), std::make_pair(std::string("10.99.7.0/24"), std::string("10.99.0.0/24")));

    controller.Stop();
}

TEST_F(ControllerTest, MissingSelfNodeStillSyncsRoutes)
{
    boost::json::array nodes;
    nodes.push_back(Fakes::NodeJson("n2", "10.99.1.0/24"));
    api_.SetList(Kube::Paths::kNodes, Fakes::ListJson(std::move(nodes)));

    Agent::Controller controller(api_, Settings(), Hooks(false));
    controller.Start();

    ASSERT_TRUE(WaitFor([&] { return routes_.Applied() == RouteMap{{"10.99.1.0/24", kVia}}; }));
    EXPECT_EQ(self_.Count(), 0u);
    EXPECT_TRUE(controller.LastApplied().empty());

    api_.Push(Kube::Paths::kNodes, "ADDED", Fakes::NodeJson("n1", "10.99.0.0/24", "11"));
    EXPECT_TRUE(WaitFor([&] { return controller.LastApplied() == "10.99.0.0/24"; }));
}

TEST_F(ControllerTest, ServiceEventsTriggerServeSync)
{
    boost::json::array nodes;
    nodes.push_back(Fakes::NodeJson("n1", "10.99.0.0/24"));
    api_.SetList(Kube::Paths::kNodes, Fakes::ListJson(std::move(nodes)));

    Agent::Controller controller(api_, Settings(), Hooks(true));
    controller.Start();

    ASSERT_TRUE(WaitFor([&] { return ServiceCalls() >= 1; }));
    {
        std::lock_guard<std::mutex> lk(svc_mu_);
        EXPECT_TRUE(svc_seen_self_);
    }

    boost::json::object obj{
        {"metadata", boost::json::object{{"namespace", "web"}, {"name", "svc-a"}, {"resourceVersion", "20"}}},
        {"spec", boost::json::object{{"type", "LoadBalancer"}, {"loadBalancerClass", "podweave.io/overlay"}}}};
    api_.Push(Kube::Paths::kServices, "ADDED", obj);

    EXPECT_TRUE(WaitFor([&] { return ServiceCount() == 1; }));
}

TEST_F(ControllerTest, NoServiceInformersWithoutHook)
{
    Agent::Controller controller(api_, Settings(), Hooks(false));
    controller.Start();
    ASSERT_TRUE(WaitFor([&] { return controller.Synced(); }));

    EXPECT_EQ(api_.ListCalls(Kube::Paths::kServices), 0);
    EXPECT_EQ(api_.ListCalls(Kube::Paths::kEndpointSlices), 0);
    EXPECT_EQ(controller.PodStore(), nullptr);
}

TEST_F(ControllerTest, PodCacheWhenRequested)
{
    Agent::Controller controller(api_, Settings(true), Hooks(false));
    controller.Start();
    ASSERT_TRUE(WaitFor([&] { return controller.Synced(); }));

    EXPECT_EQ(api_.ListCalls(Kube::Paths::PodsOnNode("n1")), 1);
    EXPECT_NE(controller.PodStore(), nullptr);
}

TEST_F(ControllerTest, ReconcileSelfIsIdempotent)
{
    Agent::Controller controller(api_, Settings(), Hooks(false));

    controller.ReconcileSelf({"n1", "10.99.0.0/24"});
    controller.ReconcileSelf({"n1", "10.99.0.0/24"});

    EXPECT_EQ(self_.Count(), 1u);
    EXPECT_EQ(controller.LastApplied(), "10.99.0.0/24");
}

TEST_F(ControllerTest, FailedApplyIsRetried)
{
    Agent::Controller controller(api_, Settings(), Hooks(false));

    self_.fail = true;
    controller.ReconcileSelf({"n1", "10.99.0.0/24"});
    EXPECT_TRUE(controller.LastApplied().empty());

    self_.fail = false;
    controller.ReconcileSelf({"n1", "10.99.0.0/24"});
    EXPECT_EQ(self_.Count(), 2u);
    EXPECT_EQ(controller.LastApplied(), "10.99.0.0/24");
}

TEST_F(ControllerTest, LostSubnetKeepsConfig)
{
    Agent::Controller controller(api_, Settings(), Hooks(false));

    controller.ReconcileSelf({"n1", ""});
    EXPECT_EQ(self_.Count(), 0u);

    controller.ReconcileSelf({"n1", "10.99.0.0/24"});
    controller.ReconcileSelf({"n1", ""});
    controller.ReconcileSelf({"n1", ""});

    EXPECT_EQ(self_.Count(), 1u);
    EXPECT_EQ(controller.LastApplied(), "10.99.0.0/24");

    controller.ReconcileSelf({"n1", "10.99.0.0/24"});
    EXPECT_EQ(self_.Count(), 1u);
}
