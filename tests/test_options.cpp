#include "Core/Agent/Options.hpp"

#include <gtest/gtest.h>

namespace
{
    boost::json::object Parse(const char *text)
    {
        return boost::json::parse(text).as_object();
    }
}

TEST(Options, Defaults)
{
    const auto opt = Agent::ParseOptions(Parse("{}"), "node-a");

    EXPECT_EQ(opt.node_name, "node-a");
    EXPECT_EQ(opt.cni_dir, "/etc/cni/net.d");
    EXPECT_TRUE(opt.cni_bin_dir.empty());
    EXPECT_EQ(opt.bridge, "cni0");
    EXPECT_EQ(opt.cluster_cidr, "10.99.0.0/16");
    EXPECT_EQ(opt.overlay_interface, "tailscale0");
    EXPECT_EQ(opt.overlay_timeout.count(), 10);
    EXPECT_EQ(opt.resync.count(), 1800);
    EXPECT_EQ(opt.metadata_port, 4160);
    EXPECT_TRUE(opt.manage_routes);
    EXPECT_TRUE(opt.expose_services);
    EXPECT_EQ(opt.load_balancer_class, "podweave.io/overlay");
    EXPECT_EQ(opt.log_level, boost::log::trivial::info);
}

TEST(Options, FileOverridesEnvironment)
{
    const auto opt = Agent::ParseOptions(
        Parse(R"({"node_name":"node-b","metadata_port":0,"log_level":"DEBUG","manage_routes":false})"),
        "node-a");

    EXPECT_EQ(opt.node_name, "node-b");
    EXPECT_EQ(opt.metadata_port, 0);
    EXPECT_FALSE(opt.manage_routes);
    EXPECT_EQ(opt.log_level, boost::log::trivial::debug);
}

TEST(Options, Rejects)
{
    EXPECT_THROW(Agent::ParseOptions(Parse("{}"), nullptr), std::invalid_argument);
    EXPECT_THROW(Agent::ParseOptions(Parse("{}"), ""), std::invalid_argument);
    EXPECT_THROW(Agent::ParseOptions(Parse(R"({"metadata_port":70000})"), "n"), std::invalid_argument);
    EXPECT_THROW(Agent::ParseOptions(Parse(R"({"overlay_timeout_seconds":0})"), "n"), std::invalid_argument);
    EXPECT_THROW(Agent::ParseOptions(Parse(R"({"log_level":"loud"})"), "n"), std::invalid_argument);
    EXPECT_THROW(Agent::ParseOptions(Parse(R"({"bridge":""})"), "n"), std::invalid_argument);
    EXPECT_THROW(Agent::ParseOptions(Parse(R"({"resync_seconds":"soon"})"), "n"), std::invalid_argument);
}
