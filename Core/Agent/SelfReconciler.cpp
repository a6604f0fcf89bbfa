#include "Core/Agent/SelfReconciler.hpp"
#include "Core/Cni/Conflist.hpp"
#include "Core/Net/FirewallRules.hpp"
#include "Core/Net/Network.hpp"
#include "Core/Overlay/Client.hpp"
#include "Core/Logger.hpp"

namespace Agent
{
    SelfReconciler::SelfReconciler(Settings         settings,
                                   Overlay::Client &overlay,
                                   FirewallRules   &firewall)
        : settings_(std::move(settings))
        , overlay_(overlay)
        , firewall_(firewall)
    {
    }

    void SelfReconciler::Apply(const std::string &subnet,
                               const std::string &previous)
    {
        LOGI("agent") << "Self: applying subnet " << subnet
                      << (previous.empty() ? std::string() : " (was " + previous + ")");

        if (!settings_.cni_bin_dir.empty())
        {
            Cni::CopyPlugins(settings_.cni_plugin_source, settings_.cni_bin_dir);
        }
        Cni::WriteConflist(settings_.cni_dir, settings_.bridge, subnet, settings_.cluster_cidr);

        if (Overlay::AdvertiseRoute(overlay_, subnet))
        {
            LOGI("agent") << "Self: advertised " << subnet;
        }
        if (!previous.empty() && previous != subnet && Overlay::UnadvertiseRoute(overlay_, previous))
        {
            LOGI("agent") << "Self: unadvertised " << previous;
        }
        if (Overlay::EnsureAcceptRoutes(overlay_, true))
        {
            LOGI("agent") << "Self: accept-routes enabled";
        }

        if (settings_.metadata_port && settings_.set_route_localnet &&
            !NetConfig::write_sysctl("/proc/sys/net/ipv4/conf/all/route_localnet", "1"))
        {
            LOGW("agent") << "Self: route_localnet not set, metadata redirect may not work";
        }

        FirewallRules::Params fw;
        fw.pod_cidr       = subnet;
        fw.bridge_ifname  = settings_.bridge;
        fw.overlay_ifname = settings_.overlay_interface;
        fw.metadata_port  = settings_.metadata_port;
        firewall_.Reconcile(fw);

        LOGI("agent") << "Self: subnet " << subnet << " applied";
    }
} // namespace Agent
