#pragma once

#include "Core/Kube/Types.hpp"
#include "Core/Net/RouteSync.hpp"

#include <string>
#include <vector>

namespace Agent
{
    /**
     * @brief Желаемые маршруты к подсетям остальных узлов через собственный overlay-адрес.
     *
     * Свой узел, узлы без подсети и подсети не IPv4 пропускаются.
     */
    Routes::RouteSync::RouteMap DesiredPeerRoutes(const std::string             &self_name,
                                                  const std::vector<Kube::Node> &nodes,
                                                  const std::string             &via);
} // namespace Agent
