#include "Core/Kube/HttpsApi.hpp"
#include "Core/Logger.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

namespace Kube
{
    namespace
    {
        namespace beast = boost::beast;
        namespace http  = beast::http;
        namespace net   = boost::asio;
        namespace ssl   = boost::asio::ssl;
        using tcp       = net::ip::tcp;

        using TlsStream = beast::ssl_stream<beast::tcp_stream>;

        constexpr const char *kServiceAccountDir = "/var/run/secrets/kubernetes.io/serviceaccount";
        constexpr std::uint64_t kMaxBody         = 64ull * 1024 * 1024;

        // Запустить одну асинхронную операцию и дождаться её в текущем потоке.
        template <typename Start>
        beast::error_code RunOp(net::io_context &ioc,
                                Start          &&start)
        {
            beast::error_code result = net::error::would_block;
            start([&result](beast::error_code ec, auto&&...) { result = ec; });
            ioc.restart();
            ioc.run();
            return result;
        }

        std::string ReadFile(const std::string &path)
        {
            std::ifstream in(path);
            if (!in)
            {
                throw std::runtime_error("cannot read " + path);
            }
            std::stringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }

        std::string Trim(std::string s)
        {
            const auto b = s.find_first_not_of(" \t\r\n");
            const auto e = s.find_last_not_of(" \t\r\n");
            return (b == std::string::npos) ? std::string() : s.substr(b, e - b + 1);
        }

        std::string Verb(http::verb v)
        {
            const auto sv = http::to_string(v);
            return std::string(sv.data(), sv.size());
        }

        bool IsIpLiteral(const std::string &host)
        {
            beast::error_code ec;
            net::ip::make_address(host, ec);
            return !ec;
        }

        void Connect(net::io_context            &ioc,
                     TlsStream                  &stream,
                     const HttpsApi::Options    &opt)
        {
            tcp::resolver     resolver(ioc);
            beast::error_code ec;
            const auto results = resolver.resolve(opt.host, opt.port, ec);
            if (ec)
            {
                throw ApiError(0, "kube: resolve " + opt.host + ": " + ec.message());
            }

            if (!IsIpLiteral(opt.host) &&
                !SSL_set_tlsext_host_name(stream.native_handle(), opt.host.c_str()))
            {
                throw ApiError(0, "kube: SNI setup failed");
            }
            stream.set_verify_callback(ssl::host_name_verification(opt.host));

            beast::get_lowest_layer(stream).expires_after(opt.timeout);
            ec = RunOp(ioc, [&](auto h) { beast::get_lowest_layer(stream).async_connect(results, std::move(h)); });
            if (ec)
            {
                throw ApiError(0, "kube: connect " + opt.host + ":" + opt.port + ": " + ec.message());
            }

            ec = RunOp(ioc, [&](auto h) { stream.async_handshake(ssl::stream_base::client, std::move(h)); });
            if (ec)
            {
                throw ApiError(0, "kube: TLS handshake: " + ec.message());
            }
        }

        http::request<http::string_body> MakeRequest(http::verb         method,
                                                     const std::string &target,
                                                     const std::string &host,
                                                     const std::string &token,
                                                     const std::string &body)
        {
            http::request<http::string_body> req{method, target, 11};
            req.set(http::field::host, host);
            req.set(http::field::user_agent, "podweave");
            req.set(http::field::accept, "application/json");
            if (!token.empty())
            {
                req.set(http::field::authorization, "Bearer " + token);
            }
            if (!body.empty())
            {
                req.set(http::field::content_type, "application/json");
                req.body() = body;
            }
            req.prepare_payload();
            return req;
        }
    }

    HttpsApi::Options HttpsApi::InClusterOptions()
    {
        const char *host = std::getenv("KUBERNETES_SERVICE_HOST");
        const char *port = std::getenv("KUBERNETES_SERVICE_PORT");
        if (!host || !*host)
        {
            throw std::runtime_error("kube: KUBERNETES_SERVICE_HOST is not set (not running in a cluster?)");
        }

        Options o;
        o.host       = host;
        o.port       = (port && *port) ? port : "443";
        o.token_file = std::string(kServiceAccountDir) + "/token";
        o.ca_file    = std::string(kServiceAccountDir) + "/ca.crt";

        // Проверяем доступность сразу: без них агент не стартует.
        (void) ReadFile(o.token_file);
        (void) ReadFile(o.ca_file);
        return o;
    }

    HttpsApi::HttpsApi(Options options)
        : opt_(std::move(options))
        , ssl_ctx_(ssl::context::tls_client)
    {
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
        if (!opt_.ca_file.empty())
        {
            ssl_ctx_.load_verify_file(opt_.ca_file);
        }
        else
        {
            ssl_ctx_.set_default_verify_paths();
        }
        LOGI("kube") << "HttpsApi: endpoint https://" << opt_.host << ":" << opt_.port;
    }

    std::string HttpsApi::Token_() const
    {
        if (opt_.token_file.empty())
        {
            return {};
        }
        try
        {
            return Trim(ReadFile(opt_.token_file));
        }
        catch (const std::exception &e)
        {
            throw ApiError(0, std::string("kube: token: ") + e.what());
        }
    }

    boost::json::object HttpsApi::Call_(http::verb         method,
                                        const std::string &target,
                                        const std::string &body)
    {
        net::io_context ioc;
        TlsStream       stream(ioc, ssl_ctx_);
        Connect(ioc, stream, opt_);

        auto req = MakeRequest(method, target, opt_.host, Token_(), body);

        beast::get_lowest_layer(stream).expires_after(opt_.timeout);
        beast::error_code ec = RunOp(ioc, [&](auto h) { http::async_write(stream, req, std::move(h)); });
        if (ec)
        {
            throw ApiError(0, "kube: " + Verb(method) + " " + target + ": write: " + ec.message());
        }

        beast::flat_buffer                       buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(kMaxBody);
        ec = RunOp(ioc, [&](auto h) { http::async_read(stream, buffer, parser, std::move(h)); });
        if (ec)
        {
            throw ApiError(0, "kube: " + Verb(method) + " " + target + ": read: " + ec.message());
        }

        const auto &res    = parser.get();
        const unsigned st  = res.result_int();
        LOGT("kube") << Verb(method) << " " << target << " -> " << st;
        if (st < 200 || st >= 300)
        {
            throw ApiError(st, "kube: " + Verb(method) + " " + target + ": HTTP " + std::to_string(st) +
                               ": " + res.body().substr(0, 256));
        }

        boost::system::error_code jec;
        boost::json::value v = boost::json::parse(res.body(), jec);
        if (jec || !v.is_object())
        {
            throw ApiError(st, "kube: " + target + ": response is not a JSON object");
        }
        return std::move(v.as_object());
    }

    boost::json::object HttpsApi::List(const std::string &path)
    {
        return Call_(http::verb::get, path);
    }

    boost::json::object HttpsApi::GetService(const std::string &ns,
                                             const std::string &name)
    {
        return Call_(http::verb::get, "/api/v1/namespaces/" + ns + "/services/" + name);
    }

    void HttpsApi::UpdateServiceStatus(const std::string         &ns,
                                       const std::string         &name,
                                       const boost::json::object &service)
    {
        Call_(http::verb::put, "/api/v1/namespaces/" + ns + "/services/" + name + "/status",
              boost::json::serialize(service));
    }

    void HttpsApi::Watch(const std::string &path,
                         const std::string &resource_version,
                         const EventFn     &on_event,
                         std::stop_token    stop)
    {
        const char sep = (path.find('?') == std::string::npos) ? '?' : '&';
        const std::string target = path + sep + "watch=1&allowWatchBookmarks=true&timeoutSeconds=" +
                                   std::to_string(opt_.watch_timeout.count()) +
                                   "&resourceVersion=" + resource_version;

        net::io_context ioc;
        TlsStream       stream(ioc, ssl_ctx_);

        // Остановка: отменить ожидающую операцию из потока io_context.
        std::stop_callback on_stop(stop, [&]
        {
            net::post(ioc, [&] { beast::get_lowest_layer(stream).cancel(); });
        });
        if (stop.stop_requested())
        {
            return;
        }

        Connect(ioc, stream, opt_);

        auto req = MakeRequest(http::verb::get, target, opt_.host, Token_(), {});
        beast::get_lowest_layer(stream).expires_after(opt_.timeout);
        beast::error_code ec = RunOp(ioc, [&](auto h) { http::async_write(stream, req, std::move(h)); });
        if (ec)
        {
            if (stop.stop_requested()) return;
            throw ApiError(0, "kube: watch " + path + ": write: " + ec.message());
        }

        beast::flat_buffer                       buffer;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit(std::numeric_limits<std::uint64_t>::max());

        ec = RunOp(ioc, [&](auto h) { http::async_read_header(stream, buffer, parser, std::move(h)); });
        if (ec)
        {
            if (stop.stop_requested()) return;
            throw ApiError(0, "kube: watch " + path + ": read header: " + ec.message());
        }
        const unsigned st = parser.get().result_int();
        if (st != 200)
        {
            throw ApiError(st, "kube: watch " + path + ": HTTP " + std::to_string(st));
        }
        LOGD("informer") << "watch " << path << " from rv=" << resource_version;

        std::string pending;
        char        chunk[16 * 1024];
        while (!parser.is_done())
        {
            parser.get().body().data = chunk;
            parser.get().body().size = sizeof(chunk);

            beast::get_lowest_layer(stream).expires_after(opt_.watch_timeout + std::chrono::seconds(30));
            ec = RunOp(ioc, [&](auto h) { http::async_read_some(stream, buffer, parser, std::move(h)); });
            if (ec == http::error::need_buffer)
            {
                ec = {};
            }
            if (ec)
            {
                if (stop.stop_requested() || ec == http::error::end_of_stream)
                {
                    return;
                }
                throw ApiError(0, "kube: watch " + path + ": read: " + ec.message());
            }

            pending.append(chunk, sizeof(chunk) - parser.get().body().size);

            std::string::size_type pos;
            while ((pos = pending.find('\n')) != std::string::npos)
            {
                const std::string line = pending.substr(0, pos);
                pending.erase(0, pos + 1);
                if (Trim(line).empty())
                {
                    continue;
                }

                boost::system::error_code jec;
                boost::json::value ev = boost::json::parse(line, jec);
                if (jec || !ev.is_object())
                {
                    throw ApiError(0, "kube: watch " + path + ": bad event JSON");
                }
                const auto &eo   = ev.as_object();
                const auto *type = eo.if_contains("type");
                const auto *obj  = eo.if_contains("object");
                if (!type || !type->is_string() || !obj || !obj->is_object())
                {
                    throw ApiError(0, "kube: watch " + path + ": malformed event");
                }
                on_event(std::string(type->as_string().data(), type->as_string().size()), obj->as_object());
            }
        }
    }
} // namespace Kube
