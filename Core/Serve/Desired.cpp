#include "Core/Serve/Desired.hpp"
#include "Core/Serve/ServiceName.hpp"
#include "Core/Net/Network.hpp"
#include "Core/Logger.hpp"

#include <set>

namespace Serve
{
    namespace
    {
        // host:port, IPv6 в скобках.
        std::string JoinHostPort(const std::string &host,
                                 int                port)
        {
            if (host.find(':') != std::string::npos)
            {
                return "[" + host + "]:" + std::to_string(port);
            }
            return host + ":" + std::to_string(port);
        }
    }

    bool IsManagedLoadBalancer(const Kube::Service &svc,
                               const Settings      &settings)
    {
        return svc.type == "LoadBalancer" &&
               svc.load_balancer_class &&
               *svc.load_balancer_class == settings.load_balancer_class;
    }

    bool IsEndpointOnNode(const Kube::Endpoint &ep,
                          const std::string    &node_name,
                          const std::string    &pod_cidr)
    {
        if (ep.node_name && *ep.node_name == node_name)
        {
            return true;
        }
        if (pod_cidr.empty() || ep.addresses.empty())
        {
            return false;
        }
        NetConfig::CidrV4 c{};
        if (!NetConfig::parse_cidr4(pod_cidr, c))
        {
            return false;
        }
        return NetConfig::cidr4_contains(c, ep.addresses.front());
    }

    std::vector<LocalEndpoint> LocalEndpointsForService(const std::string                      &node_name,
                                                        const std::string                      &pod_cidr,
                                                        const Kube::Service                    &svc,
                                                        const std::vector<Kube::EndpointSlice> &slices)
    {
        std::vector<LocalEndpoint> out;
        std::set<std::string>      seen;

        for (const auto &es : slices)
        {
            if (es.ns != svc.ns || es.service_name != svc.name)
            {
                continue;
            }

            std::map<std::string, int> port_by_name;
            for (const auto &p : es.ports)
            {
                if (p.name && p.port)
                {
                    port_by_name[*p.name] = *p.port;
                }
            }

            for (const auto &ep : es.endpoints)
            {
                if (!IsEndpointOnNode(ep, node_name, pod_cidr) || ep.addresses.empty())
                {
                    continue;
                }
                const std::string &addr = ep.addresses.front();
                if (!seen.insert(addr).second)
                {
                    continue;
                }
                out.push_back(LocalEndpoint{ addr, port_by_name });
            }
        }
        return out;
    }

    int ResolvePort(const std::map<std::string, int> &port_by_name,
                    const Kube::ServicePort          &port)
    {
        if (port.target_port.is_int)
        {
            return port.target_port.int_val;
        }
        auto it = port_by_name.find(port.target_port.str_val);
        return (it == port_by_name.end()) ? 0 : it->second;
    }

    Overlay::ServiceConfig BuildServiceConfig(const Kube::Service              &svc,
                                              const std::vector<LocalEndpoint> &local)
    {
        Overlay::ServiceConfig cfg;
        if (local.empty())
        {
            return cfg;
        }

        const LocalEndpoint &first = local.front();
        for (const auto &p : svc.ports)
        {
            if (p.protocol != "TCP")
            {
                continue;
            }
            const int backend = ResolvePort(first.ports, p);
            if (backend <= 0 || backend > 65535 || p.port <= 0 || p.port > 65535)
            {
                continue;
            }
            cfg.tcp_forward[static_cast<std::uint16_t>(p.port)] = JoinHostPort(first.address, backend);
        }
        return cfg;
    }

    DesiredServices BuildDesiredServices(const std::string                      &node_name,
                                         const std::string                      &pod_cidr,
                                         const std::vector<Kube::Service>       &services,
                                         const std::vector<Kube::EndpointSlice> &slices,
                                         const Settings                         &settings)
    {
        DesiredServices desired;
        for (const auto &svc : services)
        {
            if (!IsManagedLoadBalancer(svc, settings))
            {
                continue;
            }
            if (svc.cluster_ip.empty() || svc.cluster_ip == "None")
            {
                continue;
            }

            auto local = LocalEndpointsForService(node_name, pod_cidr, svc, slices);
            if (local.empty())
            {
                continue;
            }

            const std::string name = ServiceName(svc, settings.name_annotation);
            if (name.empty())
            {
                LOGW("serve") << "Service " << svc.Key() << ": empty service name, skipped";
                continue;
            }

            Overlay::ServiceConfig cfg = BuildServiceConfig(svc, local);
            if (cfg.tcp_forward.empty())
            {
                LOGD("serve") << "Service " << svc.Key() << ": no resolvable TCP ports";
                continue;
            }

            if (auto it = desired.find(name); it != desired.end())
            {
                LOGW("serve") << "Service " << svc.Key() << ": name " << name
                              << " already used by " << it->second.ns << "/" << it->second.name;
            }
            desired[name] = Exposure{ svc.ns, svc.name, std::move(local), std::move(cfg) };
        }
        return desired;
    }
} // namespace Serve
