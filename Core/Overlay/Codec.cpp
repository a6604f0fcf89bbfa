#include "Core/Overlay/Codec.hpp"

#include <algorithm>

namespace Overlay
{
    namespace
    {
        std::string Str(const boost::json::object &o,
                        const char                *key)
        {
            const boost::json::value *v = o.if_contains(key);
            if (!v || !v->is_string())
            {
                return {};
            }
            const auto &s = v->as_string();
            return std::string(s.data(), s.size());
        }

        std::vector<std::string> StrList(const boost::json::object &o,
                                         const char                *key)
        {
            std::vector<std::string> out;
            const boost::json::value *v = o.if_contains(key);
            if (!v || !v->is_array())
            {
                return out;
            }
            for (const auto &e : v->as_array())
            {
                if (e.is_string())
                {
                    out.emplace_back(e.as_string().data(), e.as_string().size());
                }
            }
            return out;
        }

        boost::json::array ToArray(const std::vector<std::string> &v)
        {
            boost::json::array a;
            for (const auto &s : v)
            {
                a.emplace_back(s);
            }
            return a;
        }

        const boost::json::object *Obj(const boost::json::object &o,
                                       const char                *key)
        {
            const boost::json::value *v = o.if_contains(key);
            return (v && v->is_object()) ? &v->as_object() : nullptr;
        }

        const boost::json::object &Root(const boost::json::value &v,
                                        const char               *what)
        {
            if (!v.is_object())
            {
                throw Error(std::string("localapi: ") + what + ": expected JSON object");
            }
            return v.as_object();
        }

        std::string TrimDot(std::string s)
        {
            while (!s.empty() && s.back() == '.')
            {
                s.pop_back();
            }
            return s;
        }
    }

    Status DecodeStatus(const boost::json::value &v)
    {
        const auto &o = Root(v, "status");
        Status st;

        if (const auto *self = Obj(o, "Self"))
        {
            st.self_ips = StrList(*self, "TailscaleIPs");
        }
        if (st.self_ips.empty())
        {
            st.self_ips = StrList(o, "TailscaleIPs");
        }

        if (const auto *tn = Obj(o, "CurrentTailnet"))
        {
            st.magic_dns_suffix = TrimDot(Str(*tn, "MagicDNSSuffix"));
        }
        if (st.magic_dns_suffix.empty())
        {
            st.magic_dns_suffix = TrimDot(Str(o, "MagicDNSSuffix"));
        }
        return st;
    }

    Prefs DecodePrefs(const boost::json::value &v)
    {
        const auto &o = Root(v, "prefs");
        Prefs p;
        p.advertise_routes   = StrList(o, "AdvertiseRoutes");
        p.advertise_services = StrList(o, "AdvertiseServices");
        if (const auto *ra = o.if_contains("RouteAll"); ra && ra->is_bool())
        {
            p.route_all = ra->as_bool();
        }
        return p;
    }

    boost::json::object EncodeMaskedPrefs(const MaskedPrefs &mp)
    {
        boost::json::object o;
        if (mp.advertise_routes_set)
        {
            o["AdvertiseRoutesSet"] = true;
            o["AdvertiseRoutes"]    = ToArray(mp.advertise_routes);
        }
        if (mp.route_all_set)
        {
            o["RouteAllSet"] = true;
            o["RouteAll"]    = mp.route_all;
        }
        if (mp.advertise_services_set)
        {
            o["AdvertiseServicesSet"] = true;
            o["AdvertiseServices"]    = ToArray(mp.advertise_services);
        }
        return o;
    }

    WhoIs DecodeWhoIs(const boost::json::value &v)
    {
        const auto &o = Root(v, "whois");
        WhoIs w;
        if (const auto *n = Obj(o, "Node"))
        {
            w.node = NodeInfo{ Str(*n, "Name"), Str(*n, "ComputedName"), Str(*n, "StableID") };
        }
        if (const auto *u = Obj(o, "UserProfile"))
        {
            w.user_profile = UserProfile{ Str(*u, "LoginName"), Str(*u, "DisplayName") };
        }
        return w;
    }

    CertPair SplitCertPair(const std::string &body)
    {
        static const std::string kBoundary = "--\n--";
        auto i = body.find(kBoundary);
        if (i == std::string::npos)
        {
            throw Error("localapi: cert pair: no key/cert boundary");
        }
        i += 3; // "--\n" остаётся у ключа

        CertPair cp;
        cp.key_pem  = body.substr(0, i);
        cp.cert_pem = body.substr(i);
        if (cp.cert_pem.find(" PRIVATE KEY-----") != std::string::npos)
        {
            throw Error("localapi: cert pair: private key in certificate part");
        }
        return cp;
    }

    boost::json::object EncodeServiceConfig(const ServiceConfig &sc)
    {
        boost::json::object tcp;
        for (const auto &[port, fwd] : sc.tcp_forward)
        {
            boost::json::object h;
            h["TCPForward"] = fwd;
            tcp[std::to_string(port)] = std::move(h);
        }
        boost::json::object o;
        o["TCP"] = std::move(tcp);
        return o;
    }

    ServiceConfig DecodeServiceConfig(const boost::json::value &v)
    {
        ServiceConfig sc;
        if (!v.is_object())
        {
            return sc;
        }
        const auto *tcp = Obj(v.as_object(), "TCP");
        if (!tcp)
        {
            return sc;
        }
        for (const auto &kv : *tcp)
        {
            if (!kv.value().is_object())
            {
                continue;
            }
            const std::string key(kv.key().data(), kv.key().size());
            if (key.empty() || key.size() > 5 || key.find_first_not_of("0123456789") != std::string::npos)
            {
                continue;
            }
            const unsigned long port = std::stoul(key);
            if (port == 0 || port > 65535)
            {
                continue;
            }
            sc.tcp_forward[static_cast<std::uint16_t>(port)] = Str(kv.value().as_object(), "TCPForward");
        }
        return sc;
    }

    std::vector<std::string> ServeServiceNames(const ServeConfig &cfg)
    {
        std::vector<std::string> names;
        if (const auto *svcs = Obj(cfg.document, "Services"))
        {
            for (const auto &kv : *svcs)
            {
                names.emplace_back(kv.key().data(), kv.key().size());
            }
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    void UpsertServeService(ServeConfig         &cfg,
                            const std::string   &name,
                            const ServiceConfig &sc)
    {
        boost::json::value &svcs = cfg.document["Services"];
        if (!svcs.is_object())
        {
            svcs = boost::json::object();
        }
        svcs.as_object()[name] = EncodeServiceConfig(sc);
    }

    bool RemoveServeService(ServeConfig       &cfg,
                            const std::string &name)
    {
        boost::json::value *svcs = cfg.document.if_contains("Services");
        if (!svcs || !svcs->is_object())
        {
            return false;
        }
        return svcs->as_object().erase(name) > 0;
    }
} // namespace Overlay
