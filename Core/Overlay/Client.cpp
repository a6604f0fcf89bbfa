#include "Core/Overlay/Client.hpp"
#include "Core/Logger.hpp"

#include <algorithm>
#include <arpa/inet.h>

namespace Overlay
{
    bool AdvertiseRoute(Client            &c,
                        const std::string &cidr)
    {
        Prefs p = c.GetPrefs();
        if (std::find(p.advertise_routes.begin(), p.advertise_routes.end(), cidr) != p.advertise_routes.end())
        {
            LOGD("overlay") << "AdvertiseRoute: " << cidr << " already advertised";
            return false;
        }

        MaskedPrefs mp;
        mp.advertise_routes_set = true;
        mp.advertise_routes     = std::move(p.advertise_routes);
        mp.advertise_routes.push_back(cidr);
        c.EditPrefs(mp);
        LOGI("overlay") << "AdvertiseRoute: advertised " << cidr;
        return true;
    }

    bool UnadvertiseRoute(Client            &c,
                          const std::string &cidr)
    {
        Prefs p = c.GetPrefs();
        auto it = std::remove(p.advertise_routes.begin(), p.advertise_routes.end(), cidr);
        if (it == p.advertise_routes.end())
        {
            return false;
        }
        p.advertise_routes.erase(it, p.advertise_routes.end());

        MaskedPrefs mp;
        mp.advertise_routes_set = true;
        mp.advertise_routes     = std::move(p.advertise_routes);
        c.EditPrefs(mp);
        LOGI("overlay") << "UnadvertiseRoute: withdrew " << cidr;
        return true;
    }

    bool EnsureAcceptRoutes(Client &c,
                            bool    accept)
    {
        const Prefs p = c.GetPrefs();
        if (p.route_all == accept)
        {
            return false;
        }

        MaskedPrefs mp;
        mp.route_all_set = true;
        mp.route_all     = accept;
        c.EditPrefs(mp);
        LOGI("overlay") << "EnsureAcceptRoutes: accept-routes=" << (accept ? "on" : "off");
        return true;
    }

    void SetAdvertiseServices(Client                         &c,
                              const std::vector<std::string> &services)
    {
        MaskedPrefs mp;
        mp.advertise_services_set = true;
        mp.advertise_services     = services;
        c.EditPrefs(mp);
    }

    std::optional<std::string> SelfIPv4(const Status &st)
    {
        for (const auto &ip : st.self_ips)
        {
            in_addr ia{};
            if (inet_pton(AF_INET, ip.c_str(), &ia) == 1)
            {
                return ip;
            }
        }
        return std::nullopt;
    }
} // namespace Overlay
