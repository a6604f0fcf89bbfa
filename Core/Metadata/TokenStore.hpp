#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Metadata
{
    /**
     * @brief Сессионные токены metadata-сервиса.
     *
     * Токен: 16 случайных байт (OpenSSL RAND_bytes) в hex. Срок жизни
     * ограничен [kMinTtl, kMaxTtl] секунд. Просроченные токены удаляются
     * только через Prune().
     */
    class TokenStore
    {
    public:
        using Clock  = std::chrono::steady_clock;
        using TimeFn = std::function<Clock::time_point()>;

        static constexpr int kMinTtl = 1;
        static constexpr int kMaxTtl = 21600;

        explicit TokenStore(TimeFn now = [] { return Clock::now(); });

        /**
         * @brief Выпустить токен.
         * @param ttl_seconds Срок жизни; приводится к [kMinTtl, kMaxTtl].
         * @throws std::runtime_error если CSPRNG недоступен.
         */
        std::string Create(int ttl_seconds);

        /// Токен известен и не просрочен.
        bool Valid(const std::string &token) const;

        /// @return Сколько токенов удалено.
        std::size_t Prune();

        std::size_t Size() const;

    private:
        TimeFn                                              now_;
        mutable std::mutex                                  mu_;
        std::unordered_map<std::string, Clock::time_point>  tokens_;
    };
} // namespace Metadata
