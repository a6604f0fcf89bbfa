#include "Core/Agent/SelfReconciler.hpp"
#include "Core/Cni/Conflist.hpp"
#include "Core/Net/FirewallRules.hpp"
#include "Fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace
{
    class SelfReconcilerTest : public ::testing::Test
    {
    protected:
        SelfReconcilerTest()
            : root_(fs::temp_directory_path() / "podweave_self_test")
        {
            fs::remove_all(root_);

            auto nft = std::make_unique<Fakes::NftExecutor>();
            nft_       = nft.get();
            firewall_  = std::make_unique<FirewallRules>(std::move(nft));

            settings_.cni_dir            = (root_ / "net.d").string();
            settings_.bridge             = "cni-pw0";
            settings_.cluster_cidr       = "10.99.0.0/16";
            settings_.overlay_interface  = "tailscale0";
            settings_.metadata_port      = 4160;
            settings_.set_route_localnet = false;
        }

        ~SelfReconcilerTest() override
        {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }

        Agent::SelfReconciler Make()
        {
            return Agent::SelfReconciler(settings_, overlay_, *firewall_);
        }

        fs::path                         root_;
        Fakes::OverlayClient             overlay_;
        Fakes::NftExecutor              *nft_ = nullptr;
        std::unique_ptr<FirewallRules>   firewall_;
        Agent::SelfReconciler::Settings  settings_;
    };
}

TEST_F(SelfReconcilerTest, AppliesSubnet)
{
    Make().Apply("10.99.1.0/24", "");

    EXPECT_TRUE(fs::exists(root_ / "net.d" / Cni::kConflistName));
    EXPECT_EQ(overlay_.prefs.advertise_routes, (std::vector<std::string>{"10.99.1.0/24"}));
    EXPECT_TRUE(overlay_.prefs.route_all);

    ASSERT_EQ(nft_->scripts.size(), 1u);
    EXPECT_NE(nft_->scripts[0].find("10.99.1.0/24"), std::string::npos);
    EXPECT_NE(nft_->scripts[0].find("4160"), std::string::npos);
}

TEST_F(SelfReconcilerTest, ReplacesPreviousSubnet)
{
    overlay_.prefs.advertise_routes = {"192.168.0.0/24", "10.99.1.0/24"};

    Make().Apply("10.99.2.0/24", "10.99.1.0/24");

    EXPECT_EQ(overlay_.prefs.advertise_routes, (std::vector<std::string>{"192.168.0.0/24", "10.99.2.0/24"}));
}

TEST_F(SelfReconcilerTest, RepeatDoesNotRewritePrefs)
{
    auto self = Make();
    self.Apply("10.99.1.0/24", "");
    const int edits = overlay_.edit_prefs_calls;

    self.Apply("10.99.1.0/24", "10.99.1.0/24");

    EXPECT_EQ(overlay_.edit_prefs_calls, edits);
    EXPECT_EQ(nft_->scripts.size(), 2u);
}

TEST_F(SelfReconcilerTest, NoMetadataRedirectWhenDisabled)
{
    settings_.metadata_port.reset();
    Make().Apply("10.99.1.0/24", "");

    ASSERT_EQ(nft_->scripts.size(), 1u);
    EXPECT_EQ(nft_->scripts[0].find("4160"), std::string::npos);
}

TEST_F(SelfReconcilerTest, FirewallFailurePropagates)
{
    nft_->fail = true;
    EXPECT_THROW(Make().Apply("10.99.1.0/24", ""), std::runtime_error);
}

TEST_F(SelfReconcilerTest, MissingPluginSourceFails)
{
    settings_.cni_bin_dir       = (root_ / "bin").string();
    settings_.cni_plugin_source = (root_ / "nowhere").string();

    EXPECT_THROW(Make().Apply("10.99.1.0/24", ""), std::runtime_error);
    EXPECT_TRUE(overlay_.prefs.advertise_routes.empty());
}
