#include "Core/Kube/Api.hpp"
#include "Core/Kube/Types.hpp"
#include "Core/Logger.hpp"

#include <algorithm>

namespace Kube
{
    bool EnsureLoadBalancerHostname(Api               &api,
                                    const std::string &ns,
                                    const std::string &name,
                                    const std::string &hostname)
    {
        boost::json::object obj = api.GetService(ns, name);

        const Service current = Service::FromJson(obj);
        if (std::find(current.ingress_hostnames.begin(), current.ingress_hostnames.end(), hostname)
            != current.ingress_hostnames.end())
        {
            return false;
        }

        boost::json::value &status = obj["status"];
        if (!status.is_object())
        {
            status = boost::json::object();
        }
        boost::json::value &lb = status.as_object()["loadBalancer"];
        if (!lb.is_object())
        {
            lb = boost::json::object();
        }
        boost::json::array ingress;
        ingress.emplace_back(boost::json::object{{"hostname", hostname}});
        lb.as_object()["ingress"] = std::move(ingress);

        api.UpdateServiceStatus(ns, name, obj);
        LOGI("kube") << "Service " << ns << "/" << name << ": status hostname=" << hostname;
        return true;
    }
} // namespace Kube
