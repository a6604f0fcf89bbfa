#pragma once

#include "Core/Overlay/Types.hpp"

#include <optional>
#include <string>
#include <vector>

/**
 * @file Client.hpp
 * @brief Интерфейс управления overlay-демоном и производные операции над ним.
 */

namespace Overlay
{
    /**
     * @brief Управляющий интерфейс overlay-демона.
     *
     * Все методы бросают Overlay::Error при сбое транспорта или ответе не-2xx.
     */
    class Client
    {
    public:
        virtual ~Client() = default;

        virtual Status GetStatus() = 0;

        virtual Prefs GetPrefs() = 0;

        /// @return Настройки после изменения.
        virtual Prefs EditPrefs(const MaskedPrefs &mp) = 0;

        virtual ServeConfig GetServeConfig() = 0;

        virtual void SetServeConfig(const ServeConfig &cfg) = 0;

        virtual WhoIs WhoIsAddr(const std::string &addr) = 0;

        virtual CertPair GetCertPair(const std::string &domain) = 0;
    };

    /**
     * @brief Добавить подсеть в AdvertiseRoutes, если её там нет.
     * @return true, если была запись.
     */
    bool AdvertiseRoute(Client            &c,
                        const std::string &cidr);

    /**
     * @brief Убрать подсеть из AdvertiseRoutes, если она там есть.
     * @return true, если была запись.
     */
    bool UnadvertiseRoute(Client            &c,
                          const std::string &cidr);

    /**
     * @brief Привести RouteAll (accept-routes) к значению accept.
     * @return true, если была запись.
     */
    bool EnsureAcceptRoutes(Client &c,
                            bool    accept);

    /// Заменить список AdvertiseServices целиком.
    void SetAdvertiseServices(Client                         &c,
                              const std::vector<std::string> &services);

    /// Первый IPv4 среди адресов узла.
    std::optional<std::string> SelfIPv4(const Status &st);
} // namespace Overlay
