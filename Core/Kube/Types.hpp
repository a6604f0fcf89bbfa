#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <boost/json.hpp>

/**
 * @file Types.hpp
 * @brief Объекты Kubernetes в объёме, который читает агент.
 *
 * FromJson() терпим к отсутствующим полям: пустые строки и списки.
 * Key() даёт ключ кэша ("name" для кластерных объектов, "ns/name" для остальных).
 */

namespace Kube
{
    struct Node
    {
        std::string name;
        std::string pod_cidr; ///< spec.podCIDR, пусто пока не назначен.

        std::string Key() const { return name; }
        static Node FromJson(const boost::json::object &o);
    };

    /**
     * @brief targetPort: число или имя порта.
     */
    struct IntOrString
    {
        bool        is_int  = true;
        int         int_val = 0;
        std::string str_val;
    };

    struct ServicePort
    {
        std::string name;
        std::string protocol = "TCP";
        int         port     = 0;
        IntOrString target_port;
    };

    struct Service
    {
        std::string                        ns;
        std::string                        name;
        std::map<std::string, std::string> annotations;
        std::string                        type;
        std::optional<std::string>         load_balancer_class;
        std::string                        cluster_ip;
        std::vector<ServicePort>           ports;
        std::vector<std::string>           ingress_hostnames; ///< status.loadBalancer.ingress[].hostname

        std::string Key() const { return ns + "/" + name; }
        static Service FromJson(const boost::json::object &o);
    };

    struct EndpointPort
    {
        std::optional<std::string> name;
        std::optional<int>         port;
    };

    struct Endpoint
    {
        std::vector<std::string>   addresses;
        std::optional<std::string> node_name;
    };

    struct EndpointSlice
    {
        std::string               ns;
        std::string               name;
        std::string               service_name; ///< метка kubernetes.io/service-name
        std::vector<EndpointPort> ports;
        std::vector<Endpoint>     endpoints;

        std::string Key() const { return ns + "/" + name; }
        static EndpointSlice FromJson(const boost::json::object &o);
    };

    struct Pod
    {
        std::string ns;
        std::string name;
        std::string pod_ip;
        std::string node_name;

        std::string Key() const { return ns + "/" + name; }
        static Pod FromJson(const boost::json::object &o);
    };
} // namespace Kube
