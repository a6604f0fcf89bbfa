#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/json.hpp>

/**
 * @file Types.hpp
 * @brief Модель данных overlay-демона (LocalAPI), ограниченная полями, которые читает агент.
 */

namespace Overlay
{
    /**
     * @brief Ошибка обмена с overlay-демоном (транспорт или не-2xx ответ).
     */
    class Error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct Status
    {
        std::vector<std::string> self_ips;  ///< Адреса узла в overlay (IPv4 и IPv6).
        std::string              magic_dns_suffix; ///< Без завершающей точки; пусто, если неизвестен.
    };

    struct Prefs
    {
        std::vector<std::string> advertise_routes;
        bool                     route_all = false; ///< accept-routes
        std::vector<std::string> advertise_services;
    };

    /**
     * @brief Частичное изменение настроек: отправляются только поля с флагом *_set.
     */
    struct MaskedPrefs
    {
        bool                     advertise_routes_set = false;
        std::vector<std::string> advertise_routes;

        bool route_all_set = false;
        bool route_all     = false;

        bool                     advertise_services_set = false;
        std::vector<std::string> advertise_services;
    };

    /**
     * @brief Конфигурация одного именованного сервиса: порт -> "addr:port".
     */
    struct ServiceConfig
    {
        std::map<std::uint16_t, std::string> tcp_forward;

        bool operator==(const ServiceConfig &o) const { return tcp_forward == o.tcp_forward; }
    };

    /**
     * @brief Документ serve-config целиком.
     *
     * Хранится как JSON-объект, чтобы чужие поля переживали чтение-изменение-запись.
     */
    struct ServeConfig
    {
        boost::json::object document;
        std::string         etag;
    };

    struct NodeInfo
    {
        std::string name;
        std::string computed_name;
        std::string stable_id;
    };

    struct UserProfile
    {
        std::string login_name;
        std::string display_name;
    };

    struct WhoIs
    {
        std::optional<NodeInfo>    node;
        std::optional<UserProfile> user_profile;
    };

    struct CertPair
    {
        std::string cert_pem;
        std::string key_pem;
    };
} // namespace Overlay
