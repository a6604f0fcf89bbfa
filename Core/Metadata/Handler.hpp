#pragma once

#include <map>
#include <string>

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

/**
 * @file Handler.hpp
 * @brief Обработка HTTP-запросов metadata-сервиса: токены, identity, сертификаты.
 *
 * Обработчик не знает о сокетах: на вход запрос и адрес клиента, на выход готовый ответ.
 * Тексты исключений наружу не попадают, только код статуса и короткое сообщение.
 */

namespace Overlay { class Client; }

namespace Metadata
{
    class TokenStore;
    class CertAuthorizer;
    class PodResolver;

    inline constexpr const char *kTtlHeader   = "X-Metadata-Token-TTL-Seconds";
    inline constexpr const char *kTokenHeader = "X-Metadata-Token";

    /// Декодировать %XX и '+' в query-строке. Битые escape-последовательности остаются как есть.
    std::string PercentDecode(const std::string &s);

    /// Разобрать "a=1&b=2" (без '?').
    std::map<std::string, std::string> ParseQuery(const std::string &query);

    /**
     * @brief Убрать порт из "host:port" или "[v6]:port". Голый IPv6 возвращается без изменений.
     */
    std::string StripPort(const std::string &addr);

    class Handler
    {
    public:
        using Request  = boost::beast::http::request<boost::beast::http::string_body>;
        using Response = boost::beast::http::response<boost::beast::http::string_body>;

        /**
         * @param authorizer nullptr отключает /cert (404 после проверки токена).
         * @param pods nullptr: под вызывающего в журнал не пишется.
         */
        Handler(TokenStore           &tokens,
                Overlay::Client      &overlay,
                const CertAuthorizer *authorizer,
                const PodResolver    *pods);

        Response Handle(const Request     &req,
                        const std::string &remote_ip);

    private:
        Response IssueToken_(const Request &req);

        Response Identity_(const Request                            &req,
                           const std::map<std::string, std::string> &query,
                           const std::string                        &remote_ip);

        Response Cert_(const Request                            &req,
                       const std::map<std::string, std::string> &query,
                       const std::string                        &remote_ip);

        bool TokenValid_(const Request &req) const;

        std::string CallerPod_(const std::string &ip) const;

        TokenStore           &tokens_;
        Overlay::Client      &overlay_;
        const CertAuthorizer *authorizer_;
        const PodResolver    *pods_;
    };
} // namespace Metadata
