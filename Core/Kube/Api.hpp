#pragma once

#include <functional>
#include <stdexcept>
#include <stop_token>
#include <string>

#include <boost/json.hpp>

/**
 * @file Api.hpp
 * @brief Доступ к API-серверу Kubernetes: list, watch, чтение и запись статуса Service.
 */

namespace Kube
{
    /**
     * @brief Ошибка API. status() == 0 означает сбой транспорта.
     */
    class ApiError : public std::runtime_error
    {
    public:
        ApiError(unsigned status, const std::string &what)
            : std::runtime_error(what), status_(status) {}

        unsigned status() const noexcept { return status_; }

    private:
        unsigned status_;
    };

    class Api
    {
    public:
        /// (type, object): ADDED, MODIFIED, DELETED, BOOKMARK или ERROR.
        using EventFn = std::function<void(const std::string &, const boost::json::object &)>;

        virtual ~Api() = default;

        /**
         * @brief GET списка коллекции (путь с query, если нужен).
         * @return Документ *List с items и metadata.resourceVersion.
         */
        virtual boost::json::object List(const std::string &path) = 0;

        /**
         * @brief Поток событий коллекции начиная с resource_version.
         *
         * Возвращается, когда сервер закрыл поток или сработал stop.
         * @throws ApiError при сбое соединения или статусе не 200.
         */
        virtual void Watch(const std::string &path,
                           const std::string &resource_version,
                           const EventFn     &on_event,
                           std::stop_token    stop) = 0;

        virtual boost::json::object GetService(const std::string &ns,
                                               const std::string &name) = 0;

        /// PUT .../services/<name>/status
        virtual void UpdateServiceStatus(const std::string         &ns,
                                         const std::string         &name,
                                         const boost::json::object &service) = 0;
    };

    namespace Paths
    {
        inline constexpr const char *kNodes          = "/api/v1/nodes";
        inline constexpr const char *kServices       = "/api/v1/services";
        inline constexpr const char *kEndpointSlices = "/apis/discovery.k8s.io/v1/endpointslices";

        inline std::string PodsOnNode(const std::string &node)
        {
            return "/api/v1/pods?fieldSelector=spec.nodeName%3D" + node;
        }
    }

    /**
     * @brief Записать hostname в status.loadBalancer.ingress Service.
     *
     * Чтение, затем запись только если hostname ещё не указан.
     * @return true, если статус был записан.
     * @throws ApiError при ошибке чтения или записи.
     */
    bool EnsureLoadBalancerHostname(Api               &api,
                                    const std::string &ns,
                                    const std::string &name,
                                    const std::string &hostname);
} // namespace Kube
