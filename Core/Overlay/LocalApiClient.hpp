#pragma once

#include "Core/Overlay/Client.hpp"

#include <chrono>
#include <string>

#include <boost/beast/http/verb.hpp>

namespace Overlay
{
    /**
     * @brief Клиент LocalAPI overlay-демона: HTTP/1.1 поверх unix-сокета (Boost.Beast).
     *
     * Каждый вызов открывает своё соединение и ограничен таймаутом timeout.
     * Объект не хранит состояния между вызовами и может использоваться из разных потоков.
     */
    class LocalApiClient final : public Client
    {
    public:
        LocalApiClient(std::string          socket_path,
                       std::chrono::seconds timeout);

        Status GetStatus() override;
        Prefs GetPrefs() override;
        Prefs EditPrefs(const MaskedPrefs &mp) override;
        ServeConfig GetServeConfig() override;
        void SetServeConfig(const ServeConfig &cfg) override;
        WhoIs WhoIsAddr(const std::string &addr) override;
        CertPair GetCertPair(const std::string &domain) override;

    private:
        struct Reply
        {
            unsigned    status = 0;
            std::string body;
            std::string etag;
        };

        Reply Call_(boost::beast::http::verb method,
                    const std::string       &target,
                    const std::string       &body     = {},
                    const std::string       &if_match = {}) const;

        boost::json::value CallJson_(boost::beast::http::verb method,
                                     const std::string       &target,
                                     const std::string       &body = {}) const;

        std::string          socket_path_;
        std::chrono::seconds timeout_;
    };
} // namespace Overlay
