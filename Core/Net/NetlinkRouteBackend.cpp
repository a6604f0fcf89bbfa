#include "Core/Net/NetlinkRouteBackend.hpp"
#include "Core/Net/Network.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <linux/rtnetlink.h>
#include <net/if.h>
#include <sys/socket.h>

#include <netlink/handlers.h>
#include <netlink/msg.h>
#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/route/nexthop.h>
#include <netlink/route/route.h>

namespace Routes
{
    namespace
    {
        struct AckState
        {
            bool done  = false;
            int  error = 0; ///< errno из NLMSG_ERROR, 0 при успехе.
        };

        int OnAck(nl_msg *, void *arg)
        {
            auto *st  = static_cast<AckState*>(arg);
            st->done  = true;
            st->error = 0;
            return NL_STOP;
        }

        int OnError(sockaddr_nl *, nlmsgerr *err, void *arg)
        {
            auto *st  = static_cast<AckState*>(arg);
            st->done  = true;
            st->error = -err->error;
            return NL_STOP;
        }

        // Владение nl_addr / rtnl_route / nl_msg на время одного запроса.
        struct RouteRequest
        {
            nl_addr     *dst   = nullptr;
            nl_addr     *gw    = nullptr;
            rtnl_route  *route = nullptr;
            nl_msg      *msg   = nullptr;

            ~RouteRequest()
            {
                if (msg)   nlmsg_free(msg);
                if (route) rtnl_route_put(route);
                if (gw)    nl_addr_put(gw);
                if (dst)   nl_addr_put(dst);
            }
        };

        nl_addr *ParsePrefix(const std::string &cidr)
        {
            NetConfig::CidrV4 c{};
            if (!NetConfig::parse_cidr4(cidr, c))
            {
                throw std::invalid_argument("route: not an IPv4 prefix: " + cidr);
            }
            nl_addr *dst = nullptr;
            const int err = nl_addr_parse(NetConfig::to_network_cidr(c).c_str(), AF_INET, &dst);
            if (err < 0)
            {
                throw std::runtime_error(std::string("nl_addr_parse(dst): ") + nl_geterror(err));
            }
            return dst;
        }
    }

    NetlinkBackend::NetlinkBackend(std::string egress_ifname)
        : egress_ifname_(std::move(egress_ifname))
    {
        sk_ = NetConfig::nl_connect_route();
        if (!sk_)
        {
            throw std::runtime_error("NetlinkBackend: cannot open NETLINK_ROUTE socket");
        }
        LOGI("routes") << "NetlinkBackend: ready egress="
                       << (egress_ifname_.empty() ? "-" : egress_ifname_);
    }

    NetlinkBackend::~NetlinkBackend()
    {
        if (sk_)
        {
            nl_socket_free(sk_);
        }
    }

    int NetlinkBackend::ResolveIfindex_() const
    {
        if (egress_ifname_.empty())
        {
            return 0;
        }
        const unsigned idx = if_nametoindex(egress_ifname_.c_str());
        if (idx == 0)
        {
            throw std::runtime_error("route: link " + egress_ifname_ + " not found: " + std::strerror(errno));
        }
        return static_cast<int>(idx);
    }

    int NetlinkBackend::SendAndWaitAck_(nl_msg *msg)
    {
        int rc = nl_send_auto(sk_, msg);
        if (rc < 0)
        {
            throw std::runtime_error(std::string("nl_send_auto: ") + nl_geterror(rc));
        }

        nl_cb *cb = nl_cb_alloc(NL_CB_DEFAULT);
        if (!cb)
        {
            throw std::runtime_error("nl_cb_alloc failed");
        }

        AckState st;
        nl_cb_set(cb, NL_CB_ACK, NL_CB_CUSTOM, &OnAck, &st);
        nl_cb_err(cb, NL_CB_CUSTOM, &OnError, &st);

        while (!st.done)
        {
            rc = nl_recvmsgs(sk_, cb);
            if (rc < 0 && !st.done)
            {
                nl_cb_put(cb);
                throw std::runtime_error(std::string("nl_recvmsgs: ") + nl_geterror(rc));
            }
        }
        nl_cb_put(cb);
        return st.error;
    }

    Outcome NetlinkBackend::Add(const std::string &cidr,
                                const std::string &via)
    {
        std::lock_guard<std::mutex> lk(mu_);

        RouteRequest req;
        req.dst = ParsePrefix(cidr);

        int err = nl_addr_parse(via.c_str(), AF_INET, &req.gw);
        if (err < 0)
        {
            throw std::runtime_error(std::string("nl_addr_parse(gw): ") + nl_geterror(err));
        }

        req.route = rtnl_route_alloc();
        if (!req.route)
        {
            throw std::runtime_error("rtnl_route_alloc failed");
        }
        rtnl_route_set_family(req.route, AF_INET);
        rtnl_route_set_table(req.route, RT_TABLE_MAIN);
        rtnl_route_set_dst(req.route, req.dst);
        rtnl_route_set_type(req.route, RTN_UNICAST);
        rtnl_route_set_scope(req.route, RT_SCOPE_UNIVERSE);
        rtnl_route_set_protocol(req.route, RTPROT_STATIC);

        const int ifindex = ResolveIfindex_();
        rtnl_nexthop *nh  = rtnl_route_nh_alloc();
        if (!nh)
        {
            throw std::runtime_error("rtnl_route_nh_alloc failed");
        }
        if (ifindex > 0)
        {
            rtnl_route_nh_set_ifindex(nh, ifindex);
        }
        rtnl_route_nh_set_gateway(nh, req.gw);
        rtnl_route_add_nexthop(req.route, nh);

        err = rtnl_route_build_add_request(req.route, NLM_F_EXCL, &req.msg);
        if (err < 0)
        {
            throw std::runtime_error(std::string("rtnl_route_build_add_request: ") + nl_geterror(err));
        }

        const int sys = SendAndWaitAck_(req.msg);
        switch (sys)
        {
            case 0:
                LOGD("routes") << "Add: ok " << cidr << " via " << via;
                return Outcome::Ok;
            case EEXIST:
                return Outcome::AlreadyExists;
            case ENETUNREACH:
                return Outcome::Unreachable;
            default:
                throw std::runtime_error("route add " + cidr + " via " + via + ": " + std::strerror(sys));
        }
    }

    Outcome NetlinkBackend::Delete(const std::string &cidr)
    {
        std::lock_guard<std::mutex> lk(mu_);

        RouteRequest req;
        req.dst   = ParsePrefix(cidr);
        req.route = rtnl_route_alloc();
        if (!req.route)
        {
            throw std::runtime_error("rtnl_route_alloc failed");
        }
        rtnl_route_set_family(req.route, AF_INET);
        rtnl_route_set_table(req.route, RT_TABLE_MAIN);
        rtnl_route_set_dst(req.route, req.dst);
        rtnl_route_set_scope(req.route, RT_SCOPE_NOWHERE);

        const int err = rtnl_route_build_del_request(req.route, 0, &req.msg);
        if (err < 0)
        {
            throw std::runtime_error(std::string("rtnl_route_build_del_request: ") + nl_geterror(err));
        }

        const int sys = SendAndWaitAck_(req.msg);
        switch (sys)
        {
            case 0:
                LOGD("routes") << "Delete: ok " << cidr;
                return Outcome::Ok;
            case ESRCH:
            case ENOENT:
                return Outcome::NotFound;
            default:
                throw std::runtime_error("route delete " + cidr + ": " + std::strerror(sys));
        }
    }
} // namespace Routes
