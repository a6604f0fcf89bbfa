#pragma once

#include "Core/Kube/Types.hpp"
#include "Core/Overlay/Types.hpp"

#include <map>
#include <string>
#include <vector>

/**
 * @file Desired.hpp
 * @brief Расчёт желаемых overlay-сервисов узла из снимков Service и EndpointSlice.
 *
 * Все функции чистые.
 */

namespace Serve
{
    struct Settings
    {
        std::string load_balancer_class = "podweave.io/overlay";
        std::string name_annotation     = "podweave.io/service-name";
    };

    /**
     * @brief Локальный backend: первый адрес endpoint и таблица "имя порта -> номер" его slice.
     */
    struct LocalEndpoint
    {
        std::string                address;
        std::map<std::string, int> ports;
    };

    struct Exposure
    {
        std::string                ns;
        std::string                name;
        std::vector<LocalEndpoint> local_endpoints;
        Overlay::ServiceConfig     config;
    };

    /// Ключ: имя overlay-сервиса "svc:...".
    using DesiredServices = std::map<std::string, Exposure>;

    /// type=LoadBalancer и loadBalancerClass совпадает с нашим.
    bool IsManagedLoadBalancer(const Kube::Service &svc,
                               const Settings      &settings);

    /**
     * @brief Endpoint на этом узле: по nodeName, иначе по попаданию первого адреса в подсеть узла.
     *
     * Запасной вариант верен, только пока подсети узлов не пересекаются и не переиспользуются.
     */
    bool IsEndpointOnNode(const Kube::Endpoint &ep,
                          const std::string    &node_name,
                          const std::string    &pod_cidr);

    /// Локальные endpoints Service без повторов адреса, в порядке slice и endpoints.
    std::vector<LocalEndpoint> LocalEndpointsForService(const std::string                      &node_name,
                                                        const std::string                      &pod_cidr,
                                                        const Kube::Service                    &svc,
                                                        const std::vector<Kube::EndpointSlice> &slices);

    /// Номер порта backend или 0, если не разрешается.
    int ResolvePort(const std::map<std::string, int> &port_by_name,
                    const Kube::ServicePort          &port);

    /**
     * @brief Конфигурация сервиса: все TCP-порты ведут на первый локальный endpoint.
     * @return Пустой tcp_forward, если не разрешился ни один порт.
     */
    Overlay::ServiceConfig BuildServiceConfig(const Kube::Service              &svc,
                                              const std::vector<LocalEndpoint> &local);

    DesiredServices BuildDesiredServices(const std::string                      &node_name,
                                         const std::string                      &pod_cidr,
                                         const std::vector<Kube::Service>       &services,
                                         const std::vector<Kube::EndpointSlice> &slices,
                                         const Settings                         &settings);
} // namespace Serve
