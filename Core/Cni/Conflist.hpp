#pragma once

#include <string>

#include <boost/json.hpp>

/**
 * @file Conflist.hpp
 * @brief Конфигурация CNI для kubelet: bridge + host-local + portmap.
 */

namespace Cni
{
    inline constexpr const char *kConflistName = "10-podweave.conflist";
    inline constexpr const char *kNetworkName  = "podweave";

    /// Шлюз по умолчанию, если подсеть узла не разбирается.
    inline constexpr const char *kFallbackGateway = "10.99.0.1";

    /**
     * @brief Первый адрес подсети (сеть + 1), либо kFallbackGateway.
     */
    std::string GatewayForSubnet(const std::string &subnet);

    /**
     * @brief Документ conflist.
     * @param cluster_cidr Пусто или "0.0.0.0/0": маршрут на кластер не добавляется.
     */
    boost::json::object BuildConflist(const std::string &bridge,
                                      const std::string &subnet,
                                      const std::string &cluster_cidr);

    /**
     * @brief Записать <dir>/10-podweave.conflist атомарно (временный файл и rename).
     * @return Полный путь файла.
     * @throws std::runtime_error при ошибке файловой системы.
     */
    std::string WriteConflist(const std::string &dir,
                              const std::string &bridge,
                              const std::string &subnet,
                              const std::string &cluster_cidr);

    /**
     * @brief Скопировать host-local, bridge, portmap и loopback из source_dir в dest_dir (0755).
     * @throws std::runtime_error если плагина нет или копирование не удалось.
     */
    void CopyPlugins(const std::string &source_dir,
                     const std::string &dest_dir);
} // namespace Cni
