#pragma once

#include "Core/Net/RouteBackend.hpp"

#include <mutex>
#include <string>

struct nl_sock;
struct nl_msg;

namespace Routes
{
    /**
     * @brief Маршруты через rtnetlink (libnl-route), таблица main, protocol static.
     *
     * Если задан egress_ifname, nexthop привязывается к этому интерфейсу.
     * Один netlink-сокет на объект, вызовы сериализованы.
     */
    class NetlinkBackend final : public Backend
    {
    public:
        explicit NetlinkBackend(std::string egress_ifname);
        ~NetlinkBackend() override;

        NetlinkBackend(const NetlinkBackend&)            = delete;
        NetlinkBackend& operator=(const NetlinkBackend&) = delete;

        Outcome Add(const std::string &cidr,
                    const std::string &via) override;

        Outcome Delete(const std::string &cidr) override;

    private:
        int ResolveIfindex_() const;
        int SendAndWaitAck_(nl_msg *msg);

        std::string egress_ifname_;
        nl_sock    *sk_ = nullptr;
        std::mutex  mu_;
    };
} // namespace Routes
