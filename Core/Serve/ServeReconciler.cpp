#include "Core/Serve/ServeReconciler.hpp"
#include "Core/Serve/ServiceName.hpp"
#include "Core/Kube/Api.hpp"
#include "Core/Metadata/CertAuthorizer.hpp"
#include "Core/Overlay/Client.hpp"
#include "Core/Overlay/Codec.hpp"
#include "Core/Logger.hpp"

namespace Serve
{
    ServeReconciler::ServeReconciler(std::string               node_name,
                                     Settings                  settings,
                                     Overlay::Client          &overlay,
                                     Kube::Api                *status_api,
                                     Metadata::CertAuthorizer *authorizer)
        : node_name_(std::move(node_name))
        , settings_(std::move(settings))
        , overlay_(overlay)
        , status_api_(status_api)
        , authorizer_(authorizer)
    {
    }

    std::set<std::string> ServeReconciler::Managed() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return managed_;
    }

    void ServeReconciler::Reconcile(const std::optional<Kube::Node>        &self,
                                    const std::vector<Kube::Service>       &services,
                                    const std::vector<Kube::EndpointSlice> &slices)
    {
        if (!self)
        {
            LOGD("serve") << "Reconcile: node " << node_name_ << " not in cache yet";
            return;
        }

        std::lock_guard<std::mutex> lk(mu_);

        const DesiredServices desired =
            BuildDesiredServices(node_name_, self->pod_cidr, services, slices, settings_);

        std::set<std::string> next;
        for (const auto &kv : desired)
        {
            next.insert(kv.first);
        }
        const std::set<std::string> last = managed_;

        Overlay::ServeConfig      cfg    = overlay_.GetServeConfig();
        const boost::json::object before = cfg.document;

        for (const auto &name : last)
        {
            if (next.count(name) == 0 && Overlay::RemoveServeService(cfg, name))
            {
                LOGI("serve") << "Reconcile: de-registered " << name;
            }
        }
        for (const auto &[name, exp] : desired)
        {
            Overlay::UpsertServeService(cfg, name, exp.config);
        }

        // Пока запись не подтверждена, своими считаются и старые, и новые имена.
        managed_.insert(next.begin(), next.end());

        if (cfg.document != before)
        {
            overlay_.SetServeConfig(cfg);
            LOGI("serve") << "Reconcile: serve config updated, " << desired.size() << " local service(s)";
        }

        const Overlay::Prefs prefs = overlay_.GetPrefs();
        std::vector<std::string> advertise;
        for (const auto &s : prefs.advertise_services)
        {
            if (last.count(s) == 0 && next.count(s) == 0)
            {
                advertise.push_back(s);
            }
        }
        advertise.insert(advertise.end(), next.begin(), next.end());
        if (advertise != prefs.advertise_services)
        {
            Overlay::SetAdvertiseServices(overlay_, advertise);
            LOGI("serve") << "Reconcile: advertising " << next.size() << " service(s)";
        }

        managed_ = next;

        const Overlay::Status st = overlay_.GetStatus();
        PatchStatuses_(desired, st.magic_dns_suffix);
        UpdateAuthorizer_(desired, st.magic_dns_suffix);
    }

    void ServeReconciler::PatchStatuses_(const DesiredServices &desired,
                                         const std::string     &suffix)
    {
        if (suffix.empty() || !status_api_)
        {
            return;
        }
        for (const auto &[name, exp] : desired)
        {
            const std::string hostname = WithoutPrefix(name) + "." + suffix;
            try
            {
                Kube::EnsureLoadBalancerHostname(*status_api_, exp.ns, exp.name, hostname);
            }
            catch (const std::exception &e)
            {
                LOGW("serve") << "Reconcile: status of " << exp.ns << "/" << exp.name << ": " << e.what();
            }
        }
    }

    void ServeReconciler::UpdateAuthorizer_(const DesiredServices &desired,
                                            const std::string     &suffix)
    {
        if (!authorizer_)
        {
            return;
        }
        Metadata::CertAuthorizer::DomainTable table;
        if (!suffix.empty())
        {
            for (const auto &[name, exp] : desired)
            {
                auto &ips = table[WithoutPrefix(name) + "." + suffix];
                for (const auto &ep : exp.local_endpoints)
                {
                    ips.push_back(ep.address);
                }
            }
        }
        authorizer_->SetAllowedDomains(table);
    }
} // namespace Serve
