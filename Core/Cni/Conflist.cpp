#include "Core/Cni/Conflist.hpp"
#include "Core/Net/Network.hpp"
#include "Core/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace Cni
{
    namespace
    {
        constexpr const char *kPlugins[] = {"host-local", "bridge", "portmap", "loopback"};

        // Записать во временный файл рядом и переименовать поверх.
        void ReplaceFile(const fs::path    &path,
                         const std::string &data)
        {
            const fs::path tmp = path.string() + ".tmp";
            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                if (!out)
                {
                    throw std::runtime_error("cni: cannot open " + tmp.string());
                }
                out << data;
                out.flush();
                if (!out)
                {
                    throw std::runtime_error("cni: write failed " + tmp.string());
                }
            }

            std::error_code ec;
            fs::rename(tmp, path, ec);
            if (ec)
            {
                fs::remove(tmp, ec);
                throw std::runtime_error("cni: rename to " + path.string() + " failed");
            }
        }
    }

    std::string GatewayForSubnet(const std::string &subnet)
    {
        NetConfig::CidrV4 c{};
        if (!NetConfig::parse_cidr4(subnet, c))
        {
            return kFallbackGateway;
        }
        return NetConfig::first_host(c);
    }

    boost::json::object BuildConflist(const std::string &bridge,
                                      const std::string &subnet,
                                      const std::string &cluster_cidr)
    {
        boost::json::array routes;
        if (!cluster_cidr.empty() && cluster_cidr != "0.0.0.0/0")
        {
            routes.push_back(boost::json::object{{"dst", cluster_cidr}});
        }
        routes.push_back(boost::json::object{{"dst", "0.0.0.0/0"}, {"gw", GatewayForSubnet(subnet)}});

        boost::json::object ipam;
        ipam["type"]   = "host-local";
        ipam["subnet"] = subnet;
        ipam["routes"] = std::move(routes);

        boost::json::object br;
        br["type"]      = "bridge";
        br["bridge"]    = bridge;
        br["isGateway"] = true;
        br["ipMasq"]    = false; // маскарадинг делает FirewallRules
        br["ipam"]      = std::move(ipam);

        boost::json::object portmap;
        portmap["type"]         = "portmap";
        portmap["capabilities"] = boost::json::object{{"portMappings", true}};

        boost::json::array plugins;
        plugins.push_back(std::move(br));
        plugins.push_back(std::move(portmap));

        boost::json::object doc;
        doc["cniVersion"] = "1.0.0";
        doc["name"]       = kNetworkName;
        doc["plugins"]    = std::move(plugins);
        return doc;
    }

    std::string WriteConflist(const std::string &dir,
                              const std::string &bridge,
                              const std::string &subnet,
                              const std::string &cluster_cidr)
    {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec)
        {
            throw std::runtime_error("cni: mkdir " + dir + ": " + ec.message());
        }

        const fs::path path = fs::path(dir) / kConflistName;
        ReplaceFile(path, boost::json::serialize(BuildConflist(bridge, subnet, cluster_cidr)) + "\n");
        LOGI("cni") << "Conflist: wrote " << path.string() << " subnet=" << subnet
                    << " gw=" << GatewayForSubnet(subnet);
        return path.string();
    }

    void CopyPlugins(const std::string &source_dir,
                     const std::string &dest_dir)
    {
        std::error_code ec;
        fs::create_directories(dest_dir, ec);
        if (ec)
        {
            throw std::runtime_error("cni: mkdir " + dest_dir + ": " + ec.message());
        }

        for (const char *name : kPlugins)
        {
            const fs::path src = fs::path(source_dir) / name;
            const fs::path dst = fs::path(dest_dir) / name;
            const fs::path tmp = dst.string() + ".tmp";

            fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
            if (ec)
            {
                throw std::runtime_error("cni: copy " + src.string() + ": " + ec.message());
            }
            fs::permissions(tmp,
                            fs::perms::owner_all |
                            fs::perms::group_read | fs::perms::group_exec |
                            fs::perms::others_read | fs::perms::others_exec,
                            ec);
            if (!ec)
            {
                fs::rename(tmp, dst, ec);
            }
            if (ec)
            {
                const std::string msg = ec.message();
                fs::remove(tmp, ec);
                throw std::runtime_error("cni: install " + dst.string() + ": " + msg);
            }
            LOGD("cni") << "Plugins: installed " << dst.string();
        }
        LOGI("cni") << "Plugins: copied to " << dest_dir;
    }
} // namespace Cni
