#pragma once

#include <cstdint>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

namespace Metadata
{
    class Handler;
    class TokenStore;

    /**
     * @brief HTTP-слушатель metadata-сервиса на 127.0.0.1 (Boost.Beast).
     *
     * Один запрос на соединение, дедлайн чтения и записи по 10 секунд.
     * Раз в 60 секунд из TokenStore удаляются просроченные токены.
     */
    class Server
    {
    public:
        /**
         * @param port 0: выбрать свободный порт (см. Port()).
         * @param threads Число потоков io_context.
         */
        Server(Handler       &handler,
               TokenStore    &tokens,
               std::uint16_t  port,
               unsigned       threads = 2);

        ~Server();

        Server(const Server&)            = delete;
        Server& operator=(const Server&) = delete;

        /**
         * @brief Привязать сокет и запустить потоки.
         * @throws std::runtime_error если порт занят или bind не удался.
         */
        void Start();

        /// Идемпотентно.
        void Stop();

        /// Фактический порт после Start().
        std::uint16_t Port() const;

    private:
        void Accept_();
        void SchedulePrune_();

        Handler       &handler_;
        TokenStore    &tokens_;
        std::uint16_t  port_;
        unsigned       thread_count_;

        boost::asio::io_context        ioc_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::steady_timer      prune_timer_;
        std::vector<std::thread>       threads_;
    };
} // namespace Metadata
