#include "Core/Agent/PeerRoutes.hpp"
#include "Core/Net/Network.hpp"
#include "Core/Logger.hpp"

namespace Agent
{
    Routes::RouteSync::RouteMap DesiredPeerRoutes(const std::string             &self_name,
                                                  const std::vector<Kube::Node> &nodes,
                                                  const std::string             &via)
    {
        Routes::RouteSync::RouteMap desired;
        for (const auto &n : nodes)
        {
            if (n.name == self_name || n.pod_cidr.empty())
            {
                continue;
            }
            NetConfig::CidrV4 c{};
            if (!NetConfig::parse_cidr4(n.pod_cidr, c))
            {
                LOGD("routes") << "Peers: skip " << n.name << " podCIDR=" << n.pod_cidr;
                continue;
            }
            desired[NetConfig::to_network_cidr(c)] = via;
        }
        return desired;
    }
} // namespace Agent
