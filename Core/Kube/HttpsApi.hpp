#pragma once

#include "Core/Kube/Api.hpp"

#include <chrono>
#include <string>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http/verb.hpp>

namespace Kube
{
    /**
     * @brief Клиент API-сервера поверх HTTPS (Boost.Beast + Asio SSL/OpenSSL).
     *
     * Каждый вызов открывает собственное соединение; потокобезопасен.
     * Токен перечитывается из файла на каждый запрос (ротация токенов service account).
     */
    class HttpsApi final : public Api
    {
    public:
        struct Options
        {
            std::string          host;
            std::string          port = "443";
            std::string          token_file;
            std::string          ca_file;
            std::chrono::seconds timeout{30};       ///< list/get/put и установка соединения
            std::chrono::seconds watch_timeout{300}; ///< timeoutSeconds для watch
        };

        /**
         * @brief Параметры из окружения пода (KUBERNETES_SERVICE_HOST/PORT, service account).
         * @throws std::runtime_error если окружение или файлы недоступны.
         */
        static Options InClusterOptions();

        explicit HttpsApi(Options options);

        boost::json::object List(const std::string &path) override;

        void Watch(const std::string &path,
                   const std::string &resource_version,
                   const EventFn     &on_event,
                   std::stop_token    stop) override;

        boost::json::object GetService(const std::string &ns,
                                       const std::string &name) override;

        void UpdateServiceStatus(const std::string         &ns,
                                 const std::string         &name,
                                 const boost::json::object &service) override;

    private:
        boost::json::object Call_(boost::beast::http::verb method,
                                  const std::string       &target,
                                  const std::string       &body = {});

        std::string Token_() const;

        Options                   opt_;
        boost::asio::ssl::context ssl_ctx_;
    };
} // namespace Kube
