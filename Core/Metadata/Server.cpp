#include "Core/Metadata/Server.hpp"
#include "Core/Metadata/Handler.hpp"
#include "Core/Metadata/TokenStore.hpp"
#include "Core/Logger.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

namespace beast = boost::beast;
namespace http  = boost::beast::http;
namespace net   = boost::asio;
using tcp       = boost::asio::ip::tcp;

namespace Metadata
{
    namespace
    {
        constexpr std::chrono::seconds kIoDeadline{10};
        constexpr std::chrono::seconds kPruneInterval{60};

        class Session : public std::enable_shared_from_this<Session>
        {
        public:
            Session(tcp::socket socket,
                    Handler    &handler)
                : stream_(std::move(socket))
                , handler_(handler)
            {
            }

            void Start()
            {
                boost::system::error_code ec;
                const auto ep = stream_.socket().remote_endpoint(ec);
                if (ec)
                {
                    LOGD("metadata") << "Session: remote_endpoint: " << ec.message();
                    return;
                }
                remote_ip_ = ep.address().to_string();

                stream_.expires_after(kIoDeadline);
                http::async_read(stream_, buffer_, req_,
                                 [self = shared_from_this()](beast::error_code rec, std::size_t)
                                 {
                                     self->OnRead(rec);
                                 });
            }

        private:
            void OnRead(beast::error_code ec)
            {
                if (ec)
                {
                    if (ec != http::error::end_of_stream)
                    {
                        LOGD("metadata") << "Session: read from " << remote_ip_ << ": " << ec.message();
                    }
                    Close();
                    return;
                }

                res_ = handler_.Handle(req_, remote_ip_);
                LOGT("metadata") << remote_ip_ << " " << req_.method_string() << " "
                                 << req_.target() << " -> " << res_.result_int();

                stream_.expires_after(kIoDeadline);
                http::async_write(stream_, res_,
                                  [self = shared_from_this()](beast::error_code wec, std::size_t)
                                  {
                                      if (wec)
                                      {
                                          LOGD("metadata") << "Session: write to " << self->remote_ip_
                                                           << ": " << wec.message();
                                      }
                                      self->Close();
                                  });
            }

            void Close()
            {
                boost::system::error_code ec;
                stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
                stream_.close();
            }

            beast::tcp_stream  stream_;
            Handler           &handler_;
            beast::flat_buffer buffer_;
            Handler::Request   req_;
            Handler::Response  res_;
            std::string        remote_ip_;
        };
    }

    Server::Server(Handler       &handler,
                   TokenStore    &tokens,
                   std::uint16_t  port,
                   unsigned       threads)
        : handler_(handler)
        , tokens_(tokens)
        , port_(port)
        , thread_count_(threads == 0 ? 1 : threads)
        , acceptor_(ioc_)
        , prune_timer_(ioc_)
    {
    }

    Server::~Server()
    {
        Stop();
    }

    void Server::Start()
    {
        const tcp::endpoint ep(net::ip::address_v4::loopback(), port_);
        boost::system::error_code ec;

        acceptor_.open(ep.protocol(), ec);
        if (ec)
        {
            LOGE("metadata") << "Listen: open: " << ec.message();
            throw std::runtime_error("metadata: acceptor open: " + ec.message());
        }
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
        {
            LOGW("metadata") << "Listen: reuse_address: " << ec.message();
        }
        acceptor_.bind(ep, ec);
        if (ec)
        {
            LOGE("metadata") << "Listen: bind 127.0.0.1:" << port_ << ": " << ec.message();
            throw std::runtime_error("metadata: bind: " + ec.message());
        }
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec)
        {
            LOGE("metadata") << "Listen: listen: " << ec.message();
            throw std::runtime_error("metadata: listen: " + ec.message());
        }
        port_ = acceptor_.local_endpoint().port();

        Accept_();
        SchedulePrune_();

        for (unsigned i = 0; i < thread_count_; ++i)
        {
            threads_.emplace_back([this]
                                  {
                                      try
                                      {
                                          ioc_.run();
                                      }
                                      catch (const std::exception &e)
                                      {
                                          LOGE("metadata") << "io thread: " << e.what();
                                      }
                                  });
        }
        LOGI("metadata") << "Listen: 127.0.0.1:" << port_ << " threads=" << thread_count_;
    }

    void Server::Stop()
    {
        if (threads_.empty())
        {
            return;
        }
        ioc_.stop();
        for (auto &t : threads_)
        {
            if (t.joinable())
            {
                t.join();
            }
        }
        threads_.clear();

        boost::system::error_code ec;
        acceptor_.close(ec);
        prune_timer_.cancel();
        LOGI("metadata") << "Listen: stopped";
    }

    std::uint16_t Server::Port() const
    {
        return port_;
    }

    void Server::Accept_()
    {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket)
            {
                if (ec)
                {
                    if (ec == net::error::operation_aborted)
                    {
                        return;
                    }
                    LOGW("metadata") << "Accept: " << ec.message();
                }
                else
                {
                    std::make_shared<Session>(std::move(socket), handler_)->Start();
                }
                Accept_();
            });
    }

    void Server::SchedulePrune_()
    {
        prune_timer_.expires_after(kPruneInterval);
        prune_timer_.async_wait([this](beast::error_code ec)
                                {
                                    if (ec)
                                    {
                                        return;
                                    }
                                    const std::size_t removed = tokens_.Prune();
                                    if (removed > 0)
                                    {
                                        LOGD("metadata") << "Prune: removed " << removed
                                                         << " token(s), " << tokens_.Size() << " left";
                                    }
                                    SchedulePrune_();
                                });
    }
} // namespace Metadata
