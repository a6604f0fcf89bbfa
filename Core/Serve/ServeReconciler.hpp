#pragma once

#include "Core/Kube/Types.hpp"
#include "Core/Serve/Desired.hpp"

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Overlay  { class Client; }
namespace Kube     { class Api; }
namespace Metadata { class CertAuthorizer; }

namespace Serve
{
    /**
     * @brief Синхронизация serve-config и AdvertiseServices overlay-демона с Service кластера.
     *
     * Помнит имена, которые объявил в прошлом успешном цикле (managed), чтобы снимать
     * их, когда у сервиса не остаётся локальных backend. Циклы сериализованы.
     *
     * status_api и authorizer могут быть nullptr: тогда статус Service не пишется,
     * а таблица сертификатов не обновляется.
     */
    class ServeReconciler
    {
    public:
        ServeReconciler(std::string               node_name,
                        Settings                  settings,
                        Overlay::Client          &overlay,
                        Kube::Api                *status_api,
                        Metadata::CertAuthorizer *authorizer);

        /**
         * @brief Один цикл синхронизации.
         * @param self Объект этого узла; без него цикл ничего не делает.
         * @throws Overlay::Error при сбое обмена с overlay-демоном.
         */
        void Reconcile(const std::optional<Kube::Node>        &self,
                       const std::vector<Kube::Service>       &services,
                       const std::vector<Kube::EndpointSlice> &slices);

        std::set<std::string> Managed() const;

    private:
        void PatchStatuses_(const DesiredServices &desired,
                            const std::string     &suffix);

        void UpdateAuthorizer_(const DesiredServices &desired,
                               const std::string     &suffix);

        std::string               node_name_;
        Settings                  settings_;
        Overlay::Client          &overlay_;
        Kube::Api                *status_api_;
        Metadata::CertAuthorizer *authorizer_;

        mutable std::mutex    mu_;
        std::set<std::string> managed_;
    };
} // namespace Serve
