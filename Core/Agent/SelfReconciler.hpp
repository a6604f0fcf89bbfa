#pragma once

#include <cstdint>
#include <optional>
#include <string>

class FirewallRules;
namespace Overlay { class Client; }

namespace Agent
{
    /**
     * @brief Настройка узла под его подсеть подов.
     *
     * Шаги по порядку: плагины CNI (если задан cni_bin_dir), conflist, объявление
     * подсети в overlay (и снятие прежней), accept-routes, таблица nftables.
     * Любой сбой бросает исключение; шаги идемпотентны, так что повтор безопасен.
     */
    class SelfReconciler
    {
    public:
        struct Settings
        {
            std::string cni_dir;
            std::string cni_bin_dir;
            std::string cni_plugin_source;
            std::string bridge;
            std::string cluster_cidr;
            std::string overlay_interface;
            std::optional<std::uint16_t> metadata_port;
            bool set_route_localnet = true; ///< sysctl route_localnet для DNAT на 127.0.0.1
        };

        SelfReconciler(Settings         settings,
                       Overlay::Client &overlay,
                       FirewallRules   &firewall);

        /**
         * @param subnet Новая подсеть узла.
         * @param previous Прежняя применённая подсеть или пусто.
         */
        void Apply(const std::string &subnet,
                   const std::string &previous);

    private:
        Settings         settings_;
        Overlay::Client &overlay_;
        FirewallRules   &firewall_;
    };
} // namespace Agent
