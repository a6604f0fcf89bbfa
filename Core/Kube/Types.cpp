#include "Core/Kube/Types.hpp"

namespace Kube
{
    namespace
    {
        const boost::json::object *Obj(const boost::json::object &o,
                                       const char                *key)
        {
            const boost::json::value *v = o.if_contains(key);
            return (v && v->is_object()) ? &v->as_object() : nullptr;
        }

        const boost::json::array *Arr(const boost::json::object &o,
                                      const char                *key)
        {
            const boost::json::value *v = o.if_contains(key);
            return (v && v->is_array()) ? &v->as_array() : nullptr;
        }

        std::optional<std::string> OptStr(const boost::json::object &o,
                                          const char                *key)
        {
            const boost::json::value *v = o.if_contains(key);
            if (!v || !v->is_string())
            {
                return std::nullopt;
            }
            return std::string(v->as_string().data(), v->as_string().size());
        }

        std::string Str(const boost::json::object &o,
                        const char                *key)
        {
            return OptStr(o, key).value_or(std::string());
        }

        std::optional<int> OptInt(const boost::json::object &o,
                                  const char                *key)
        {
            const boost::json::value *v = o.if_contains(key);
            if (v && v->is_int64())  return static_cast<int>(v->as_int64());
            if (v && v->is_uint64()) return static_cast<int>(v->as_uint64());
            return std::nullopt;
        }

        std::map<std::string, std::string> StrMap(const boost::json::object *o)
        {
            std::map<std::string, std::string> out;
            if (!o)
            {
                return out;
            }
            for (const auto &kv : *o)
            {
                if (kv.value().is_string())
                {
                    out.emplace(std::string(kv.key().data(), kv.key().size()),
                                std::string(kv.value().as_string().data(), kv.value().as_string().size()));
                }
            }
            return out;
        }

        // metadata.namespace, metadata.name
        void Meta(const boost::json::object &o,
                  std::string               &ns,
                  std::string               &name)
        {
            if (const auto *m = Obj(o, "metadata"))
            {
                ns   = Str(*m, "namespace");
                name = Str(*m, "name");
            }
        }
    }

    Node Node::FromJson(const boost::json::object &o)
    {
        Node n;
        std::string ns;
        Meta(o, ns, n.name);
        if (const auto *spec = Obj(o, "spec"))
        {
            n.pod_cidr = Str(*spec, "podCIDR");
        }
        return n;
    }

    Service Service::FromJson(const boost::json::object &o)
    {
        Service s;
        Meta(o, s.ns, s.name);
        if (const auto *m = Obj(o, "metadata"))
        {
            s.annotations = StrMap(Obj(*m, "annotations"));
        }

        if (const auto *spec = Obj(o, "spec"))
        {
            s.type                = Str(*spec, "type");
            s.load_balancer_class = OptStr(*spec, "loadBalancerClass");
            s.cluster_ip          = Str(*spec, "clusterIP");

            if (const auto *ports = Arr(*spec, "ports"))
            {
                for (const auto &pv : *ports)
                {
                    if (!pv.is_object())
                    {
                        continue;
                    }
                    const auto &po = pv.as_object();

                    ServicePort p;
                    p.name     = Str(po, "name");
                    p.protocol = OptStr(po, "protocol").value_or("TCP");
                    p.port     = OptInt(po, "port").value_or(0);

                    const boost::json::value *tp = po.if_contains("targetPort");
                    if (tp && tp->is_string())
                    {
                        p.target_port.is_int  = false;
                        p.target_port.str_val = std::string(tp->as_string().data(), tp->as_string().size());
                    }
                    else
                    {
                        // Без targetPort API-сервер подставляет port.
                        p.target_port.is_int  = true;
                        p.target_port.int_val = OptInt(po, "targetPort").value_or(p.port);
                    }
                    s.ports.push_back(std::move(p));
                }
            }
        }

        if (const auto *st = Obj(o, "status"))
        {
            if (const auto *lb = Obj(*st, "loadBalancer"))
            {
                if (const auto *ing = Arr(*lb, "ingress"))
                {
                    for (const auto &iv : *ing)
                    {
                        if (iv.is_object())
                        {
                            if (auto h = OptStr(iv.as_object(), "hostname"); h && !h->empty())
                            {
                                s.ingress_hostnames.push_back(*h);
                            }
                        }
                    }
                }
            }
        }
        return s;
    }

    EndpointSlice EndpointSlice::FromJson(const boost::json::object &o)
    {
        EndpointSlice es;
        Meta(o, es.ns, es.name);
        if (const auto *m = Obj(o, "metadata"))
        {
            const auto labels = StrMap(Obj(*m, "labels"));
            if (auto it = labels.find("kubernetes.io/service-name"); it != labels.end())
            {
                es.service_name = it->second;
            }
        }

        if (const auto *ports = Arr(o, "ports"))
        {
            for (const auto &pv : *ports)
            {
                if (pv.is_object())
                {
                    es.ports.push_back(EndpointPort{ OptStr(pv.as_object(), "name"),
                                                     OptInt(pv.as_object(), "port") });
                }
            }
        }

        if (const auto *eps = Arr(o, "endpoints"))
        {
            for (const auto &ev : *eps)
            {
                if (!ev.is_object())
                {
                    continue;
                }
                const auto &eo = ev.as_object();
                Endpoint ep;
                if (const auto *addrs = Arr(eo, "addresses"))
                {
                    for (const auto &a : *addrs)
                    {
                        if (a.is_string())
                        {
                            ep.addresses.emplace_back(a.as_string().data(), a.as_string().size());
                        }
                    }
                }
                ep.node_name = OptStr(eo, "nodeName");
                es.endpoints.push_back(std::move(ep));
            }
        }
        return es;
    }

    Pod Pod::FromJson(const boost::json::object &o)
    {
        Pod p;
        Meta(o, p.ns, p.name);
        if (const auto *spec = Obj(o, "spec"))
        {
            p.node_name = Str(*spec, "nodeName");
        }
        if (const auto *st = Obj(o, "status"))
        {
            p.pod_ip = Str(*st, "podIP");
        }
        return p;
    }
} // namespace Kube
