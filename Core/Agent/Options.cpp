#include "Core/Agent/Options.hpp"
#include "Core/Config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace Agent
{
    namespace
    {
        std::int64_t InRange(std::int64_t v,
                             std::int64_t lo,
                             std::int64_t hi,
                             const char  *key)
        {
            if (v < lo || v > hi)
            {
                throw std::invalid_argument(std::string("config: key '") + key + "' out of range [" +
                                            std::to_string(lo) + ", " + std::to_string(hi) + "]");
            }
            return v;
        }
    }

    Options ParseOptions(const boost::json::object &o,
                         const char                *env_node_name)
    {
        Options opt;

        opt.node_name = Config::OptionalString(o, "node_name", env_node_name ? env_node_name : "");
        if (opt.node_name.empty())
        {
            throw std::invalid_argument("config: node_name is not set (key 'node_name' or env NODE_NAME)");
        }

        opt.cni_dir           = Config::OptionalString(o, "cni_dir",           opt.cni_dir);
        opt.cni_bin_dir       = Config::OptionalString(o, "cni_bin_dir",       opt.cni_bin_dir);
        opt.cni_plugin_source = Config::OptionalString(o, "cni_plugin_source", opt.cni_plugin_source);
        opt.bridge            = Config::OptionalString(o, "bridge",            opt.bridge);
        opt.cluster_cidr      = Config::OptionalString(o, "cluster_cidr",      opt.cluster_cidr);

        opt.overlay_socket    = Config::OptionalString(o, "overlay_socket",    opt.overlay_socket);
        opt.overlay_interface = Config::OptionalString(o, "overlay_interface", opt.overlay_interface);
        opt.overlay_timeout   = std::chrono::seconds(
            InRange(Config::OptionalInt(o, "overlay_timeout_seconds", opt.overlay_timeout.count()),
                    1, 3600, "overlay_timeout_seconds"));

        opt.resync = std::chrono::seconds(
            InRange(Config::OptionalInt(o, "resync_seconds", opt.resync.count()),
                    0, 7 * 24 * 3600, "resync_seconds"));

        opt.metadata_port = static_cast<std::uint16_t>(
            InRange(Config::OptionalInt(o, "metadata_port", opt.metadata_port), 0, 65535, "metadata_port"));
        opt.manage_routes   = Config::OptionalBool(o, "manage_routes",   opt.manage_routes);
        opt.expose_services = Config::OptionalBool(o, "expose_services", opt.expose_services);

        opt.load_balancer_class     = Config::OptionalString(o, "load_balancer_class",     opt.load_balancer_class);
        opt.service_name_annotation = Config::OptionalString(o, "service_name_annotation", opt.service_name_annotation);

        opt.log_directory = Config::OptionalString(o, "log_directory", opt.log_directory);
        const std::string level = Config::OptionalString(o, "log_level", "info");
        if (!Logger::ParseSeverity(level, opt.log_level))
        {
            throw std::invalid_argument("config: unknown log_level '" + level + "'");
        }

        if (opt.bridge.empty() || opt.overlay_interface.empty())
        {
            throw std::invalid_argument("config: bridge and overlay_interface must not be empty");
        }
        return opt;
    }

    Options LoadOptions(const std::string &path)
    {
        return ParseOptions(Config::LoadObjectFile(path), std::getenv("NODE_NAME"));
    }
} // namespace Agent
