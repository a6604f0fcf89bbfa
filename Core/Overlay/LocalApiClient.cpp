#include "Core/Overlay/LocalApiClient.hpp"
#include "Core/Overlay/Codec.hpp"
#include "Core/Logger.hpp"

#include <cctype>
#include <cstdio>

#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace Overlay
{
    namespace
    {
        namespace beast = boost::beast;
        namespace http  = beast::http;
        namespace net   = boost::asio;

        using LocalStream = beast::basic_stream<net::local::stream_protocol>;

        constexpr const char *kHost   = "local-tailscaled.sock";
        constexpr const char *kPrefix = "/localapi/v0/";

        std::string PercentEncode(const std::string &s)
        {
            std::string out;
            for (unsigned char c : s)
            {
                if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~')
                {
                    out.push_back(static_cast<char>(c));
                }
                else
                {
                    char buf[4];
                    std::snprintf(buf, sizeof(buf), "%%%02X", c);
                    out += buf;
                }
            }
            return out;
        }

        std::string Verb(http::verb v)
        {
            const auto sv = http::to_string(v);
            return std::string(sv.data(), sv.size());
        }
    }

    LocalApiClient::LocalApiClient(std::string          socket_path,
                                   std::chrono::seconds timeout)
        : socket_path_(std::move(socket_path))
        , timeout_(timeout)
    {
    }

    LocalApiClient::Reply LocalApiClient::Call_(http::verb         method,
                                                const std::string &target,
                                                const std::string &body,
                                                const std::string &if_match) const
    {
        net::io_context ioc;
        LocalStream     stream(ioc);
        stream.expires_after(timeout_);

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, kHost);
        req.set("Sec-Tailscale", "localapi");
        req.set(http::field::user_agent, "podweave");
        if (!if_match.empty())
        {
            req.set(http::field::if_match, if_match);
        }
        if (!body.empty())
        {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();

        beast::flat_buffer                buffer;
        http::response<http::string_body> res;
        beast::error_code                 result;

        // Асинхронная цепочка под одним io_context: только так действует expires_after.
        stream.async_connect(net::local::stream_protocol::endpoint(socket_path_),
            [&](beast::error_code ec)
            {
                if (ec) { result = ec; return; }
                http::async_write(stream, req,
                    [&](beast::error_code ec, std::size_t)
                    {
                        if (ec) { result = ec; return; }
                        http::async_read(stream, buffer, res,
                            [&](beast::error_code ec, std::size_t) { result = ec; });
                    });
            });
        ioc.run();

        if (result)
        {
            LOGW("overlay") << "localapi " << Verb(method) << " " << target << ": " << result.message();
            throw Error("localapi " + Verb(method) + " " + target + ": " + result.message());
        }

        Reply r;
        r.status = res.result_int();
        r.body   = std::move(res.body());
        const auto etag = res[http::field::etag];
        r.etag.assign(etag.data(), etag.size());

        LOGT("overlay") << "localapi " << Verb(method) << " " << target << " -> " << r.status;
        if (r.status < 200 || r.status >= 300)
        {
            std::string snippet = r.body.substr(0, 256);
            while (!snippet.empty() && (snippet.back() == '\n' || snippet.back() == '\r'))
            {
                snippet.pop_back();
            }
            throw Error("localapi " + Verb(method) + " " + target + ": HTTP " +
                        std::to_string(r.status) + ": " + snippet);
        }
        return r;
    }

    boost::json::value LocalApiClient::CallJson_(http::verb         method,
                                                 const std::string &target,
                                                 const std::string &body) const
    {
        const Reply r = Call_(method, target, body);
        boost::system::error_code ec;
        boost::json::value v = boost::json::parse(r.body, ec);
        if (ec)
        {
            throw Error("localapi " + target + ": bad JSON: " + ec.message());
        }
        return v;
    }

    Status LocalApiClient::GetStatus()
    {
        return DecodeStatus(CallJson_(http::verb::get, std::string(kPrefix) + "status"));
    }

    Prefs LocalApiClient::GetPrefs()
    {
        return DecodePrefs(CallJson_(http::verb::get, std::string(kPrefix) + "prefs"));
    }

    Prefs LocalApiClient::EditPrefs(const MaskedPrefs &mp)
    {
        const std::string body = boost::json::serialize(EncodeMaskedPrefs(mp));
        return DecodePrefs(CallJson_(http::verb::patch, std::string(kPrefix) + "prefs", body));
    }

    ServeConfig LocalApiClient::GetServeConfig()
    {
        const Reply r = Call_(http::verb::get, std::string(kPrefix) + "serve-config");

        ServeConfig cfg;
        cfg.etag = r.etag;

        boost::system::error_code ec;
        boost::json::value v = boost::json::parse(r.body, ec);
        if (ec)
        {
            throw Error("localapi serve-config: bad JSON: " + ec.message());
        }
        if (v.is_object())
        {
            cfg.document = std::move(v.as_object());
        }
        else if (!v.is_null())
        {
            throw Error("localapi serve-config: expected JSON object");
        }
        return cfg;
    }

    void LocalApiClient::SetServeConfig(const ServeConfig &cfg)
    {
        Call_(http::verb::post, std::string(kPrefix) + "serve-config",
              boost::json::serialize(cfg.document), cfg.etag);
    }

    WhoIs LocalApiClient::WhoIsAddr(const std::string &addr)
    {
        return DecodeWhoIs(CallJson_(http::verb::get,
                                     std::string(kPrefix) + "whois?addr=" + PercentEncode(addr)));
    }

    CertPair LocalApiClient::GetCertPair(const std::string &domain)
    {
        const Reply r = Call_(http::verb::get,
                              std::string(kPrefix) + "cert/" + PercentEncode(domain) + "?type=pair");
        return SplitCertPair(r.body);
    }
} // namespace Overlay
