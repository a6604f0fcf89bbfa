#include "Core/Metadata/TokenStore.hpp"

#include <algorithm>
#include <stdexcept>

#include <openssl/rand.h>

namespace Metadata
{
    TokenStore::TokenStore(TimeFn now)
        : now_(std::move(now))
    {
    }

    std::string TokenStore::Create(int ttl_seconds)
    {
        const int ttl = std::clamp(ttl_seconds, kMinTtl, kMaxTtl);

        unsigned char raw[16];
        if (RAND_bytes(raw, sizeof(raw)) != 1)
        {
            throw std::runtime_error("token: RAND_bytes failed");
        }

        static const char kHex[] = "0123456789abcdef";
        std::string token;
        token.reserve(sizeof(raw) * 2);
        for (unsigned char b : raw)
        {
            token.push_back(kHex[b >> 4]);
            token.push_back(kHex[b & 0x0f]);
        }

        const auto expiry = now_() + std::chrono::seconds(ttl);
        std::lock_guard<std::mutex> lk(mu_);
        tokens_[token] = expiry;
        return token;
    }

    bool TokenStore::Valid(const std::string &token) const
    {
        if (token.empty())
        {
            return false;
        }
        const auto now = now_();
        std::lock_guard<std::mutex> lk(mu_);
        auto it = tokens_.find(token);
        return it != tokens_.end() && now < it->second;
    }

    std::size_t TokenStore::Prune()
    {
        const auto now = now_();
        std::lock_guard<std::mutex> lk(mu_);
        std::size_t removed = 0;
        for (auto it = tokens_.begin(); it != tokens_.end();)
        {
            if (now >= it->second)
            {
                it = tokens_.erase(it);
                ++removed;
            }
            else
            {
                ++it;
            }
        }
        return removed;
    }

    std::size_t TokenStore::Size() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return tokens_.size();
    }
} // namespace Metadata
