#include "Core/Agent/Controller.hpp"
#include "Core/Logger.hpp"

namespace Agent
{
    namespace
    {
        constexpr std::chrono::milliseconds kSyncPoll{100};
    }

    Controller::Controller(Kube::Api &api,
                           Settings   settings,
                           Hooks      hooks)
        : settings_(std::move(settings))
        , hooks_(std::move(hooks))
    {
        nodes_ = std::make_unique<Kube::Informer<Kube::Node>>(api, "nodes", Kube::Paths::kNodes, settings_.resync);
        nodes_->AddHandlers({
            [this](const Kube::Node &n) { OnNode_(n); },
            [this](const Kube::Node &, const Kube::Node &n) { OnNode_(n); },
            [this](const Kube::Node &) { if (synced_.load()) ReconcileRoutes(); }});

        if (hooks_.sync_services)
        {
            services_ = std::make_unique<Kube::Informer<Kube::Service>>(
                api, "services", Kube::Paths::kServices, settings_.resync);
            slices_ = std::make_unique<Kube::Informer<Kube::EndpointSlice>>(
                api, "endpointslices", Kube::Paths::kEndpointSlices, settings_.resync);

            services_->AddHandlers({
                [this](const Kube::Service &) { if (synced_.load()) ReconcileServices(); },
                [this](const Kube::Service &, const Kube::Service &) { if (synced_.load()) ReconcileServices(); },
                [this](const Kube::Service &) { if (synced_.load()) ReconcileServices(); }});
            slices_->AddHandlers({
                [this](const Kube::EndpointSlice &) { if (synced_.load()) ReconcileServices(); },
                [this](const Kube::EndpointSlice &, const Kube::EndpointSlice &) { if (synced_.load()) ReconcileServices(); },
                [this](const Kube::EndpointSlice &) { if (synced_.load()) ReconcileServices(); }});
        }

        if (settings_.watch_pods)
        {
            // Поды только кэшируются, обработчиков нет.
            pods_ = std::make_unique<Kube::Informer<Kube::Pod>>(
                api, "pods", Kube::Paths::PodsOnNode(settings_.node_name), settings_.resync);
        }
    }

    Controller::~Controller()
    {
        Stop();
    }

    void Controller::Start()
    {
        LOGI("controller") << "Start: node=" << settings_.node_name
                           << " services=" << (services_ ? "on" : "off")
                           << " pods=" << (pods_ ? "on" : "off");
        nodes_->Start();
        if (services_) services_->Start();
        if (slices_)   slices_->Start();
        if (pods_)     pods_->Start();

        sync_thread_ = std::jthread([this](std::stop_token st) { WaitAndRun_(st); });
    }

    void Controller::Stop()
    {
        sync_thread_.request_stop();
        if (sync_thread_.joinable())
        {
            sync_thread_.join();
        }
        if (pods_)     pods_->Stop();
        if (slices_)   slices_->Stop();
        if (services_) services_->Stop();
        nodes_->Stop();
    }

    const Kube::Store<Kube::Pod> *Controller::PodStore() const
    {
        return pods_ ? &pods_->GetStore() : nullptr;
    }

    std::string Controller::LastApplied() const
    {
        std::lock_guard<std::mutex> lk(self_mu_);
        return last_applied_;
    }

    bool Controller::AllSynced_() const
    {
        return nodes_->HasSynced() &&
               (!services_ || services_->HasSynced()) &&
               (!slices_   || slices_->HasSynced()) &&
               (!pods_     || pods_->HasSynced());
    }

    void Controller::WaitAndRun_(std::stop_token st)
    {
        LOGI("controller") << "Waiting for cache sync";
        while (!st.stop_requested() && !AllSynced_())
        {
            std::this_thread::sleep_for(kSyncPoll);
        }
        if (st.stop_requested())
        {
            return;
        }
        synced_.store(true);
        LOGI("controller") << "Caches synced";
        OnSynced_();
    }

    void Controller::OnSynced_()
    {
        if (const auto self = nodes_->GetStore().Get(settings_.node_name))
        {
            ReconcileSelf(*self);
        }
        else
        {
            LOGW("controller") << "Node " << settings_.node_name << " not found in cache";
        }
        ReconcileRoutes();
        if (hooks_.sync_services)
        {
            ReconcileServices();
        }
    }

    void Controller::OnNode_(const Kube::Node &node)
    {
        if (!synced_.load())
        {
            return;
        }
        if (node.name == settings_.node_name)
        {
            ReconcileSelf(node);
        }
        ReconcileRoutes();
    }

    void Controller::ReconcileSelf(const Kube::Node &node)
    {
        std::lock_guard<std::mutex> lk(self_mu_);

        if (node.pod_cidr.empty())
        {
            const EmptyState st = last_applied_.empty() ? EmptyState::NoSubnet : EmptyState::Lost;
            if (st != empty_state_)
            {
                if (st == EmptyState::Lost)
                    LOGW("controller") << "Self: node " << node.name << " lost podCIDR (was "
                                       << last_applied_ << "), keeping current config";
                else
                    LOGI("controller") << "Self: node " << node.name << " has no podCIDR yet";
                empty_state_ = st;
            }
            return;
        }
        empty_state_ = EmptyState::None;

        if (node.pod_cidr == last_applied_)
        {
            return;
        }

        LOGI("controller") << "Self: podCIDR " << (last_applied_.empty() ? "<none>" : last_applied_)
                           << " -> " << node.pod_cidr;
        try
        {
            hooks_.apply_self(node.pod_cidr, last_applied_);
            last_applied_ = node.pod_cidr;
            LOGI("controller") << "Self: reconciled " << node.pod_cidr;
        }
        catch (const std::exception &e)
        {
            LOGE("controller") << "Self: reconcile " << node.pod_cidr << " failed: " << e.what();
        }
    }

    void Controller::ReconcileRoutes()
    {
        if (!hooks_.sync_routes)
        {
            return;
        }
        try
        {
            hooks_.sync_routes(nodes_->GetStore().List());
        }
        catch (const std::exception &e)
        {
            LOGE("controller") << "Routes: reconcile failed: " << e.what();
        }
    }

    void Controller::ReconcileServices()
    {
        if (!hooks_.sync_services)
        {
            return;
        }
        try
        {
            hooks_.sync_services(nodes_->GetStore().Get(settings_.node_name),
                                 services_->GetStore().List(),
                                 slices_->GetStore().List());
        }
        catch (const std::exception &e)
        {
            LOGE("controller") << "Serve: reconcile failed: " << e.what();
        }
    }
} // namespace Agent
