// Agent.cpp: процесс podweave (кэши кластера, маршруты, nftables, serve-config, metadata)

#include "Core/Agent/Controller.hpp"
#include "Core/Agent/Options.hpp"
#include "Core/Agent/PeerRoutes.hpp"
#include "Core/Agent/SelfReconciler.hpp"
#include "Core/Kube/HttpsApi.hpp"
#include "Core/Metadata/CertAuthorizer.hpp"
#include "Core/Metadata/Handler.hpp"
#include "Core/Metadata/PodResolver.hpp"
#include "Core/Metadata/Server.hpp"
#include "Core/Metadata/TokenStore.hpp"
#include "Core/Net/FirewallRules.hpp"
#include "Core/Net/NetlinkRouteBackend.hpp"
#include "Core/Net/Network.hpp"
#include "Core/Net/RouteSync.hpp"
#include "Core/Overlay/LocalApiClient.hpp"
#include "Core/Serve/ServeReconciler.hpp"
#include "Core/Logger.hpp"

#include <csignal>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

static volatile sig_atomic_t g_working = 1;

static void OnSignal(int)
{
    g_working = 0;
}

static int AgentMain(const std::string &config_path)
{
    Agent::Options opt;
    try
    {
        opt = Agent::LoadOptions(config_path);
    }
    catch (const std::exception &e)
    {
        std::cerr << "podweave: " << e.what() << std::endl;
        return 2;
    }

    Logger::Options logger_options;
    logger_options.app_name             = "PodWeave";
    logger_options.directory            = opt.log_directory;
    logger_options.base_filename        = "podweave";
    logger_options.file_min_severity    = opt.log_level;
    logger_options.console_min_severity = opt.log_level;

    Logger::Guard logger(logger_options);
    LOGI("agent") << "Startup: begin config=" << config_path;
    LOGI("agent") << "Args: node=" << opt.node_name
                  << " bridge=" << opt.bridge
                  << " cluster_cidr=" << opt.cluster_cidr
                  << " overlay=" << opt.overlay_interface
                  << " socket=" << opt.overlay_socket
                  << " metadata_port=" << opt.metadata_port
                  << " routes=" << (opt.manage_routes ? "on" : "off")
                  << " services=" << (opt.expose_services ? "on" : "off")
                  << " resync=" << opt.resync.count() << "s";

    std::signal(SIGINT,  OnSignal);
    std::signal(SIGTERM, OnSignal);

    try
    {
        if (!NetConfig::nft_feature_probe())
        {
            throw std::runtime_error("nftables is not available on this host");
        }

        std::unique_ptr<Kube::HttpsApi> api;
        try
        {
            api = std::make_unique<Kube::HttpsApi>(Kube::HttpsApi::InClusterOptions());
            api->List(std::string(Kube::Paths::kNodes) + "?limit=1");
        }
        catch (const std::exception &e)
        {
            LOGE("agent") << "Kubernetes API unavailable: " << e.what();
            return 1;
        }
        LOGI("agent") << "Kubernetes API: reachable";

        Overlay::LocalApiClient overlay(opt.overlay_socket, opt.overlay_timeout);

        std::unique_ptr<Routes::Backend> backend;
        if (opt.manage_routes)
        {
            backend = std::make_unique<Routes::NetlinkBackend>(opt.overlay_interface);
        }
        else
        {
            LOGI("agent") << "Routes: kernel routes are not managed";
            backend = std::make_unique<Routes::NoopBackend>();
        }
        Routes::RouteSync route_sync(*backend);

        FirewallRules firewall(std::make_unique<LibNftExecutor>());

        std::optional<std::uint16_t> metadata_port;
        if (opt.metadata_port > 0)
        {
            metadata_port = opt.metadata_port;
        }

        Agent::SelfReconciler::Settings self_settings;
        self_settings.cni_dir           = opt.cni_dir;
        self_settings.cni_bin_dir       = opt.cni_bin_dir;
        self_settings.cni_plugin_source = opt.cni_plugin_source;
        self_settings.bridge            = opt.bridge;
        self_settings.cluster_cidr      = opt.cluster_cidr;
        self_settings.overlay_interface = opt.overlay_interface;
        self_settings.metadata_port     = metadata_port;
        Agent::SelfReconciler self_reconciler(self_settings, overlay, firewall);

        Metadata::CertAuthorizer authorizer;
        Serve::Settings serve_settings;
        serve_settings.load_balancer_class = opt.load_balancer_class;
        serve_settings.name_annotation     = opt.service_name_annotation;
        Serve::ServeReconciler serve(opt.node_name, serve_settings, overlay, api.get(), &authorizer);

        Agent::Controller::Hooks hooks;
        hooks.apply_self = [&self_reconciler](const std::string &subnet, const std::string &previous)
        {
            self_reconciler.Apply(subnet, previous);
        };
        hooks.sync_routes = [&](const std::vector<Kube::Node> &nodes)
        {
            const auto via = Overlay::SelfIPv4(overlay.GetStatus());
            if (!via)
            {
                throw std::runtime_error("overlay has no IPv4 address yet");
            }
            route_sync.EnsureRoutes(Agent::DesiredPeerRoutes(opt.node_name, nodes, *via));
        };
        if (opt.expose_services)
        {
            hooks.sync_services = [&serve](const std::optional<Kube::Node>        &self,
                                           const std::vector<Kube::Service>       &services,
                                           const std::vector<Kube::EndpointSlice> &slices)
            {
                serve.Reconcile(self, services, slices);
            };
        }

        Agent::Controller::Settings controller_settings;
        controller_settings.node_name  = opt.node_name;
        controller_settings.resync     = opt.resync;
        controller_settings.watch_pods = metadata_port.has_value();
        Agent::Controller controller(*api, controller_settings, hooks);

        Metadata::TokenStore                        tokens;
        std::unique_ptr<Metadata::StorePodResolver> pods;
        std::unique_ptr<Metadata::Handler>          handler;
        std::unique_ptr<Metadata::Server>           metadata;
        if (metadata_port)
        {
            if (const auto *store = controller.PodStore())
            {
                pods = std::make_unique<Metadata::StorePodResolver>(*store);
            }
            handler = std::make_unique<Metadata::Handler>(tokens, overlay,
                                                          opt.expose_services ? &authorizer : nullptr,
                                                          pods.get());
            metadata = std::make_unique<Metadata::Server>(*handler, tokens, *metadata_port);
            metadata->Start();
        }

        controller.Start();
        LOGI("agent") << "Startup: running";

        while (g_working)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        LOGI("agent") << "Shutdown: signal received";

        controller.Stop();
        LOGD("agent") << "Shutdown: controller stopped";
        if (metadata)
        {
            metadata->Stop();
            LOGD("agent") << "Shutdown: metadata stopped";
        }
        LOGI("agent") << "Shutdown: success";
        return 0;
    }
    catch (const std::exception &e)
    {
        LOGE("agent") << "Fatal: " << e.what();
        LOGI("agent") << "Shutdown: error path";
        return 1;
    }
}

int main(int argc, char **argv)
{
    const std::string config_path = argc > 1 ? argv[1] : Agent::kDefaultConfigPath;
    return AgentMain(config_path);
}
