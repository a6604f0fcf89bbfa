#include "Core/Metadata/Handler.hpp"
#include "Core/Metadata/CertAuthorizer.hpp"
#include "Core/Metadata/PodResolver.hpp"
#include "Core/Metadata/TokenStore.hpp"
#include "Core/Net/Network.hpp"
#include "Core/Overlay/Client.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <boost/beast/http/field.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/json.hpp>

namespace http = boost::beast::http;

namespace Metadata
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            const auto b = s.find_first_not_of(" \t\r\n");
            if (b == std::string::npos)
            {
                return {};
            }
            const auto e = s.find_last_not_of(" \t\r\n");
            return s.substr(b, e - b + 1);
        }

        int HexValue(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        std::string Header(const Handler::Request &req,
                           const char              *name)
        {
            const auto it = req.find(name);
            if (it == req.end())
            {
                return {};
            }
            return Trim(std::string(it->value().data(), it->value().size()));
        }

        Handler::Response Reply(const Handler::Request &req,
                                http::status            status,
                                const std::string      &content_type,
                                std::string             body)
        {
            Handler::Response res{status, req.version()};
            res.set(http::field::content_type, content_type);
            res.keep_alive(false);
            res.body() = std::move(body);
            res.prepare_payload();
            return res;
        }

        Handler::Response Text(const Handler::Request &req,
                               http::status            status,
                               const std::string      &msg)
        {
            return Reply(req, status, "text/plain; charset=utf-8", msg + "\n");
        }

        Handler::Response Json(const Handler::Request    &req,
                               const boost::json::value &v)
        {
            return Reply(req, http::status::ok, "application/json", boost::json::serialize(v));
        }

        enum class Route { Token, Identity, Cert, Unknown };

        Route RouteFor(const std::string &path)
        {
            if (path == "/metadata/api/token" || path == "/token")       return Route::Token;
            if (path == "/metadata/identity"  || path == "/identity")    return Route::Identity;
            if (path == "/metadata/cert"      || path == "/cert")        return Route::Cert;
            return Route::Unknown;
        }
    }

    std::string PercentDecode(const std::string &s)
    {
        std::string out;
        out.reserve(s.size());
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            const char c = s[i];
            if (c == '+')
            {
                out.push_back(' ');
            }
            else if (c == '%' && i + 2 < s.size() &&
                     HexValue(s[i + 1]) >= 0 && HexValue(s[i + 2]) >= 0)
            {
                out.push_back(static_cast<char>(HexValue(s[i + 1]) * 16 + HexValue(s[i + 2])));
                i += 2;
            }
            else
            {
                out.push_back(c);
            }
        }
        return out;
    }

    std::map<std::string, std::string> ParseQuery(const std::string &query)
    {
        std::map<std::string, std::string> out;
        std::size_t pos = 0;
        while (pos <= query.size())
        {
            std::size_t amp = query.find('&', pos);
            if (amp == std::string::npos)
            {
                amp = query.size();
            }
            const std::string pair = query.substr(pos, amp - pos);
            if (!pair.empty())
            {
                const auto eq = pair.find('=');
                const std::string key = PercentDecode(pair.substr(0, eq));
                const std::string val = eq == std::string::npos ? std::string{} : PercentDecode(pair.substr(eq + 1));
                out.emplace(key, val);
            }
            pos = amp + 1;
        }
        return out;
    }

    std::string StripPort(const std::string &addr)
    {
        const std::string a = Trim(addr);
        if (!a.empty() && a.front() == '[')
        {
            const auto close = a.find(']');
            if (close == std::string::npos)
            {
                return a;
            }
            return a.substr(1, close - 1);
        }
        const auto colon = a.find(':');
        if (colon != std::string::npos && a.find(':', colon + 1) == std::string::npos)
        {
            return a.substr(0, colon);
        }
        return a;
    }

    Handler::Handler(TokenStore           &tokens,
                     Overlay::Client      &overlay,
                     const CertAuthorizer *authorizer,
                     const PodResolver    *pods)
        : tokens_(tokens)
        , overlay_(overlay)
        , authorizer_(authorizer)
        , pods_(pods)
    {
    }

    Handler::Response Handler::Handle(const Request     &req,
                                      const std::string &remote_ip)
    {
        const std::string target(req.target().data(), req.target().size());
        const auto        qmark = target.find('?');
        const std::string path  = target.substr(0, qmark);
        const auto        query = qmark == std::string::npos
                                      ? std::map<std::string, std::string>{}
                                      : ParseQuery(target.substr(qmark + 1));

        switch (RouteFor(path))
        {
            case Route::Token:
                if (req.method() != http::verb::put)
                {
                    return Text(req, http::status::method_not_allowed, "method not allowed");
                }
                return IssueToken_(req);
            case Route::Identity:
                if (req.method() != http::verb::get)
                {
                    return Text(req, http::status::method_not_allowed, "method not allowed");
                }
                return Identity_(req, query, remote_ip);
            case Route::Cert:
                if (req.method() != http::verb::get)
                {
                    return Text(req, http::status::method_not_allowed, "method not allowed");
                }
                return Cert_(req, query, remote_ip);
            case Route::Unknown:
                break;
        }
        return Text(req, http::status::not_found, "not found");
    }

    Handler::Response Handler::IssueToken_(const Request &req)
    {
        const std::string raw = Header(req, kTtlHeader);
        long long ttl = 0;
        const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), ttl);
        if (raw.empty() || ec != std::errc{} || end != raw.data() + raw.size() || ttl < 1)
        {
            return Text(req, http::status::bad_request, "missing or invalid TTL");
        }
        ttl = std::min<long long>(ttl, TokenStore::kMaxTtl);

        try
        {
            const std::string token = tokens_.Create(static_cast<int>(ttl));
            LOGD("metadata") << "Token: issued ttl=" << ttl << "s";
            return Reply(req, http::status::ok, "text/plain; charset=utf-8", token);
        }
        catch (const std::exception &e)
        {
            LOGE("metadata") << "Token: " << e.what();
            return Text(req, http::status::internal_server_error, "internal error");
        }
    }

    Handler::Response Handler::Identity_(const Request                            &req,
                                         const std::map<std::string, std::string> &query,
                                         const std::string                        &remote_ip)
    {
        if (!TokenValid_(req))
        {
            LOGW("metadata") << "Identity: bad token from " << remote_ip;
            return Text(req, http::status::unauthorized, "unauthorized");
        }

        const auto it = query.find("ip");
        if (it == query.end())
        {
            return Text(req, http::status::bad_request, "missing ip");
        }
        const std::string ip = StripPort(it->second);
        if (!NetConfig::is_ip_literal(ip))
        {
            return Text(req, http::status::bad_request, "invalid ip");
        }

        LOGI("metadata") << "Identity: " << ip << " requested by " << remote_ip
                         << " pod=" << CallerPod_(remote_ip);

        Overlay::WhoIs who;
        try
        {
            who = overlay_.WhoIsAddr(ip);
        }
        catch (const std::exception &e)
        {
            LOGW("metadata") << "Identity: whois " << ip << ": " << e.what();
            return Text(req, http::status::not_found, "not found");
        }

        boost::json::object out;
        if (who.node)
        {
            out["node"] = boost::json::object{
                {"name",         who.node->name},
                {"computedName", who.node->computed_name},
                {"stableId",     who.node->stable_id}};
        }
        else
        {
            out["node"] = nullptr;
        }
        if (who.user_profile)
        {
            out["userProfile"] = boost::json::object{
                {"loginName",   who.user_profile->login_name},
                {"displayName", who.user_profile->display_name}};
        }
        else
        {
            out["userProfile"] = nullptr;
        }
        return Json(req, out);
    }

    Handler::Response Handler::Cert_(const Request                            &req,
                                     const std::map<std::string, std::string> &query,
                                     const std::string                        &remote_ip)
    {
        if (!TokenValid_(req))
        {
            LOGW("metadata") << "Cert: bad token from " << remote_ip;
            return Text(req, http::status::unauthorized, "unauthorized");
        }
        if (!authorizer_)
        {
            return Text(req, http::status::not_found, "not found");
        }

        const auto it = query.find("domain");
        const std::string domain = it == query.end() ? std::string{} : NormalizeDomain(it->second);
        if (!ValidFqdn(domain))
        {
            return Text(req, http::status::bad_request, "invalid domain");
        }

        if (!authorizer_->AllowedCertDomain(remote_ip, domain))
        {
            LOGW("metadata") << "Cert: denied " << domain << " to " << remote_ip
                             << " pod=" << CallerPod_(remote_ip);
            return Text(req, http::status::forbidden, "forbidden");
        }

        Overlay::CertPair pair;
        try
        {
            pair = overlay_.GetCertPair(domain);
        }
        catch (const std::exception &e)
        {
            LOGE("metadata") << "Cert: fetch " << domain << ": " << e.what();
            return Text(req, http::status::bad_gateway, "upstream error");
        }

        LOGI("metadata") << "Cert: issued " << domain << " to " << remote_ip
                         << " pod=" << CallerPod_(remote_ip);
        return Json(req, boost::json::object{{"certPEM", pair.cert_pem}, {"keyPEM", pair.key_pem}});
    }

    bool Handler::TokenValid_(const Request &req) const
    {
        const std::string token = Header(req, kTokenHeader);
        return !token.empty() && tokens_.Valid(token);
    }

    std::string Handler::CallerPod_(const std::string &ip) const
    {
        if (!pods_)
        {
            return "-";
        }
        const auto pod = pods_->PodForIP(ip);
        return pod ? pod->first + "/" + pod->second : "-";
    }
} // namespace Metadata
