#pragma once

#include "Core/Logger.hpp"

#include <chrono>
#include <cstdint>
#include <string>

#include <boost/json.hpp>

/**
 * @file Options.hpp
 * @brief Настройки агента из JSON-файла конфигурации.
 */

namespace Agent
{
    inline constexpr const char *kDefaultConfigPath = "/etc/podweave/config.json";

    struct Options
    {
        std::string node_name;

        std::string cni_dir           = "/etc/cni/net.d";
        std::string cni_bin_dir;                      ///< Пусто: плагины не копируются.
        std::string cni_plugin_source = "/cni";
        std::string bridge            = "cni0";
        std::string cluster_cidr      = "10.99.0.0/16";

        std::string          overlay_socket    = "/var/run/tailscale/tailscaled.sock";
        std::string          overlay_interface = "tailscale0";
        std::chrono::seconds overlay_timeout{10};

        std::chrono::seconds resync{1800};

        std::uint16_t metadata_port = 4160;           ///< 0: metadata-сервис и DNAT выключены.
        bool          manage_routes = true;           ///< false: маршруты не трогаются (no-op backend).
        bool          expose_services = true;         ///< false: Service и EndpointSlice не отслеживаются.

        std::string load_balancer_class     = "podweave.io/overlay";
        std::string service_name_annotation = "podweave.io/service-name";

        std::string      log_directory;
        Logger::Severity log_level = boost::log::trivial::info;
    };

    /**
     * @brief Разобрать объект конфигурации.
     * @param env_node_name Значение NODE_NAME (может быть nullptr), если node_name не задан.
     * @throws std::invalid_argument при неверном типе или значении ключа.
     */
    Options ParseOptions(const boost::json::object &o,
                         const char                *env_node_name);

    /**
     * @brief Прочитать файл и разобрать (NODE_NAME берётся из окружения).
     * @throws std::runtime_error если файл не читается.
     * @throws std::invalid_argument при ошибке содержимого.
     */
    Options LoadOptions(const std::string &path);
} // namespace Agent
