#include "Core/Kube/Informer.hpp"
#include "Core/Kube/Types.hpp"
#include "Fakes.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

namespace
{
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

    struct Recorder
    {
        std::mutex               mu;
        std::vector<std::string> events;

        void Add(std::string e)
        {
            std::lock_guard<std::mutex> lk(mu);
            events.push_back(std::move(e));
        }

        std::vector<std::string> Get()
        {
            std::lock_guard<std::mutex> lk(mu);
            return events;
        }

        bool Has(const std::string &e)
        {
            std::lock_guard<std::mutex> lk(mu);
            return std::find(events.begin(), events.end(), e) != events.end();
        }

        Kube::Informer<Kube::Node>::Handlers Handlers()
        {
            return {
                [this](const Kube::Node &n) { Add("add " + n.name); },
                [this](const Kube::Node &o, const Kube::Node &n) { Add("update " + n.name + " " + o.pod_cidr + "->" + n.pod_cidr); },
                [this](const Kube::Node &n) { Add("delete " + n.name); }};
        }
    };

    constexpr auto kNoResync = std::chrono::seconds(0);
    constexpr auto kNoDelay  = std::chrono::seconds(0);
}

TEST(Informer, ListThenWatch)
{
    Fakes::KubeApi api;
    api.SetList(Kube::Paths::kNodes,
                Fakes::ListJson({Fakes::NodeJson("n1", ""), Fakes::NodeJson("n2", "10.99.1.0/24")}));

    Recorder rec;
    Kube::Informer<Kube::Node> inf(api, "nodes", Kube::Paths::kNodes, kNoResync, kNoDelay);
    inf.AddHandlers(rec.Handlers());
    inf.Start();

    ASSERT_TRUE(WaitFor([&] { return inf.HasSynced(); }));
    EXPECT_EQ(rec.Get(), (std::vector<std::string>{"add n1", "add n2"}));

    api.Push(Kube::Paths::kNodes, "MODIFIED", Fakes::NodeJson("n1", "10.99.0.0/24", "11"));
    api.Push(Kube::Paths::kNodes, "DELETED", Fakes::NodeJson("n2", "10.99.1.0/24", "12"));
    api.Push(Kube::Paths::kNodes, "ADDED", Fakes::NodeJson("n3", "", "13"));

    ASSERT_TRUE(WaitFor([&] { return rec.Has("add n3"); }));
    EXPECT_TRUE(rec.Has("update n1 ->10.99.0.0/24"));
    EXPECT_TRUE(rec.Has("delete n2"));
    EXPECT_EQ(inf.GetStore().Size(), 2u);
    EXPECT_EQ(inf.GetStore().Get("n1")->pod_cidr, "10.99.0.0/24");

    inf.Stop();
}

TEST(Informer, BookmarkDoesNotDispatch)
{
    Fakes::KubeApi api;
    Recorder rec;
    Kube::Informer<Kube::Node> inf(api, "nodes", Kube::Paths::kNodes, kNoResync, kNoDelay);
    inf.AddHandlers(rec.Handlers());
    inf.Start();
    ASSERT_TRUE(WaitFor([&] { return inf.HasSynced(); }));

    api.Push(Kube::Paths::kNodes, "BOOKMARK",
             boost::json::object{{"metadata", boost::json::object{{"resourceVersion", "50"}}}});
    api.Push(Kube::Paths::kNodes, "ADDED", Fakes::NodeJson("n1", ""));

    ASSERT_TRUE(WaitFor([&] { return rec.Has("add n1"); }));
    EXPECT_EQ(rec.Get().size(), 1u);
    EXPECT_EQ(inf.GetStore().Size(), 1u);
}

TEST(Informer, ErrorEventTriggersRelistDiff)
{
    Fakes::KubeApi api;
    api.SetList(Kube::Paths::kNodes,
                Fakes::ListJson({Fakes::NodeJson("n1", ""), Fakes::NodeJson("n2", "")}));

    Recorder rec;
    Kube::Informer<Kube::Node> inf(api, "nodes", Kube::Paths::kNodes, kNoResync, kNoDelay);
    inf.AddHandlers(rec.Handlers());
    inf.Start();
    ASSERT_TRUE(WaitFor([&] { return inf.HasSynced(); }));

    api.SetList(Kube::Paths::kNodes,
                Fakes::ListJson({Fakes::NodeJson("n1", "10.99.0.0/24"), Fakes::NodeJson("n3", "")}, "20"));
    api.Push(Kube::Paths::kNodes, "ERROR",
             boost::json::object{{"kind", "Status"}, {"code", 410}, {"reason", "Gone"}});

    ASSERT_TRUE(WaitFor([&] { return rec.Has("add n3"); }));
    EXPECT_EQ(api.ListCalls(Kube::Paths::kNodes), 2);
    EXPECT_TRUE(rec.Has("update n1 ->10.99.0.0/24"));
    EXPECT_TRUE(rec.Has("delete n2"));
    EXPECT_FALSE(inf.GetStore().Get("n2"));
}

TEST(Informer, HandlerExceptionDoesNotStopWatch)
{
    Fakes::KubeApi api;
    Recorder rec;
    Kube::Informer<Kube::Node> inf(api, "nodes", Kube::Paths::kNodes, kNoResync, kNoDelay);
    inf.AddHandlers({[](const Kube::Node &) { throw std::runtime_error("boom"); }, nullptr, nullptr});
    inf.AddHandlers(rec.Handlers());
    inf.Start();
    ASSERT_TRUE(WaitFor([&] { return inf.HasSynced(); }));

    api.Push(Kube::Paths::kNodes, "ADDED", Fakes::NodeJson("n1", ""));
    api.Push(Kube::Paths::kNodes, "ADDED", Fakes::NodeJson("n2", ""));

    ASSERT_TRUE(WaitFor([&] { return rec.Has("add n2"); }));
    EXPECT_EQ(api.ListCalls(Kube::Paths::kNodes), 1);
}

TEST(Informer, ResyncRedeliversCachedObjects)
{
    Fakes::KubeApi api;
    api.SetList(Kube::Paths::kNodes, Fakes::ListJson({Fakes::NodeJson("n1", "10.99.0.0/24")}));

    Recorder rec;
    Kube::Informer<Kube::Node> inf(api, "nodes", Kube::Paths::kNodes, std::chrono::seconds(1), kNoDelay);
    inf.AddHandlers(rec.Handlers());
    inf.Start();

    ASSERT_TRUE(WaitFor([&] { return rec.Has("update n1 10.99.0.0/24->10.99.0.0/24"); }));
}
