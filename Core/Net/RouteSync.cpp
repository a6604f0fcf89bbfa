#include "Core/Net/RouteSync.hpp"
#include "Core/Logger.hpp"

namespace Routes
{
    RouteSync::RouteSync(Backend &backend)
        : backend_(backend)
    {
    }

    RouteSync::RouteMap RouteSync::Applied() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return applied_;
    }

    void RouteSync::EnsureRoutes(const RouteMap &desired)
    {
        std::lock_guard<std::mutex> lk(mu_);

        // Всё, что останется в stale после установки, подлежит удалению.
        RouteMap stale = applied_;

        for (const auto &[cidr, via] : desired)
        {
            auto it = stale.find(cidr);
            if (it != stale.end() && it->second == via)
            {
                stale.erase(it);
                continue;
            }

            if (it != stale.end())
            {
                // Шлюз сменился: старую запись снимаем, иначе ядро ответит EEXIST.
                const Outcome del = backend_.Delete(cidr);
                LOGD("routes") << "EnsureRoutes: replace " << cidr << " old via " << it->second
                               << " (" << ToString(del) << ")";
                applied_.erase(cidr);
                stale.erase(it);
            }

            const Outcome out = backend_.Add(cidr, via);
            if (out == Outcome::Unreachable)
            {
                LOGW("routes") << "EnsureRoutes: " << cidr << " via " << via
                               << " unreachable, will retry next cycle";
                continue;
            }
            if (out == Outcome::AlreadyExists)
            {
                LOGD("routes") << "EnsureRoutes: " << cidr << " via " << via << " already present";
            }
            else
            {
                LOGI("routes") << "EnsureRoutes: added " << cidr << " via " << via;
            }
            applied_[cidr] = via;
        }

        for (const auto &[cidr, via] : stale)
        {
            const Outcome out = backend_.Delete(cidr);
            if (out == Outcome::NotFound)
            {
                LOGD("routes") << "EnsureRoutes: " << cidr << " already gone";
            }
            else
            {
                LOGI("routes") << "EnsureRoutes: removed " << cidr << " via " << via;
            }
            applied_.erase(cidr);
        }
    }
} // namespace Routes
