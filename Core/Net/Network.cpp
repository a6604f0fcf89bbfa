#include "Core/Net/Network.hpp"
#include "Core/Logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <unistd.h>

#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <nftables/libnftables.h>

namespace NetConfig
{
    bool parse_ipv4(const std::string &s,
                    std::uint32_t     &out_be)
    {
        in_addr ia{};
        if (inet_pton(AF_INET, s.c_str(), &ia) != 1)
        {
            return false;
        }
        std::memcpy(&out_be, &ia.s_addr, sizeof(out_be));
        return true;
    }

    bool parse_cidr4(const std::string &s,
                     CidrV4            &out)
    {
        LOGT("network") << "parse_cidr4: s=" << s;
        const auto pos = s.find('/');
        const std::string ip = (pos == std::string::npos) ? s : s.substr(0, pos);

        int pref = 32;
        if (pos != std::string::npos)
        {
            const std::string p = s.substr(pos + 1);
            if (p.empty() || p.size() > 2 || p.find_first_not_of("0123456789") != std::string::npos)
            {
                LOGD("network") << "parse_cidr4: bad prefix s=" << s;
                return false;
            }
            pref = std::stoi(p);
        }
        if (pref < 0 || pref > 32)
        {
            LOGD("network") << "parse_cidr4: prefix out of range pref=" << pref;
            return false;
        }

        std::uint32_t be = 0;
        if (!parse_ipv4(ip, be))
        {
            LOGD("network") << "parse_cidr4: inet_pton failed ip=" << ip;
            return false;
        }
        out.addr_be = be;
        out.prefix  = static_cast<std::uint8_t>(pref);
        return true;
    }

    bool is_ip_literal(const std::string &s)
    {
        in_addr  ia{};
        in6_addr ia6{};
        return inet_pton(AF_INET, s.c_str(), &ia) == 1 ||
               inet_pton(AF_INET6, s.c_str(), &ia6) == 1;
    }

    std::uint32_t netmask_be(std::uint8_t prefix)
    {
        if (prefix == 0)
        {
            return 0;
        }
        const std::uint32_t host = (prefix >= 32) ? 0u : (0xFFFFFFFFu >> prefix);
        return htonl(~host);
    }

    static std::string ntop4(std::uint32_t be)
    {
        in_addr ia{};
        std::memcpy(&ia.s_addr, &be, sizeof(be));
        char buf[INET_ADDRSTRLEN]{};
        inet_ntop(AF_INET, &ia, buf, sizeof(buf));
        return buf;
    }

    std::string to_network_cidr(const CidrV4 &c)
    {
        const std::uint32_t net_be = c.addr_be & netmask_be(c.prefix);
        return ntop4(net_be) + "/" + std::to_string(static_cast<int>(c.prefix));
    }

    std::string first_host(const CidrV4 &c)
    {
        const std::uint32_t net_host = ntohl(c.addr_be & netmask_be(c.prefix));
        return ntop4(htonl(net_host + 1));
    }

    bool cidr4_contains(const CidrV4      &c,
                        const std::string &ip)
    {
        std::uint32_t be = 0;
        if (!parse_ipv4(ip, be))
        {
            return false;
        }
        const std::uint32_t mask = netmask_be(c.prefix);
        return (be & mask) == (c.addr_be & mask);
    }

    bool write_sysctl(const char *path,
                      const char *val)
    {
        LOGT("network") << "write_sysctl: path=" << path << " val=" << val;
        int fd = ::open(path, O_WRONLY | O_CLOEXEC);
        if (fd < 0)
        {
            LOGE("network") << "write_sysctl: open failed path=" << path << " errno=" << errno;
            return false;
        }

        const ssize_t need = static_cast<ssize_t>(std::strlen(val));
        const ssize_t n    = ::write(fd, val, need);
        ::close(fd);

        const bool ok = (n == need);
        if (!ok)
        {
            LOGW("network") << "write_sysctl: short write path=" << path << " need=" << need << " wrote=" << n;
        }
        else
        {
            LOGD("network") << "write_sysctl: ok path=" << path;
        }
        return ok;
    }

    nl_sock *nl_connect_route()
    {
        LOGD("network") << "nl_connect_route: creating NETLINK_ROUTE socket";
        nl_sock *sk = nl_socket_alloc();
        if (!sk)
        {
            LOGE("network") << "nl_connect_route: nl_socket_alloc failed";
            return nullptr;
        }

        const int rc = nl_connect(sk, NETLINK_ROUTE);
        if (rc < 0)
        {
            LOGE("network") << "nl_connect_route: nl_connect failed: " << nl_geterror(rc);
            nl_socket_free(sk);
            return nullptr;
        }
        return sk;
    }

    bool nft_feature_probe()
    {
        LOGT("network") << "nft_feature_probe: probing nftables";
        nft_ctx *ctx = nft_ctx_new(NFT_CTX_DEFAULT);
        if (!ctx)
        {
            LOGE("network") << "nft_feature_probe: nft_ctx_new failed";
            return false;
        }
        nft_ctx_buffer_output(ctx);
        nft_ctx_buffer_error(ctx);

        const int rc = nft_run_cmd_from_buffer(ctx, "list tables");
        nft_ctx_free(ctx);

        const bool ok = (rc == 0);
        if (!ok)
        {
            LOGW("network") << "nft_feature_probe: nftables not available";
        }
        else
        {
            LOGD("network") << "nft_feature_probe: nftables OK";
        }
        return ok;
    }
} // namespace NetConfig
