#include "Core/Metadata/CertAuthorizer.hpp"
#include "Core/Logger.hpp"

#include <cctype>
#include <mutex>

namespace Metadata
{
    std::string NormalizeDomain(const std::string &domain)
    {
        const auto b = domain.find_first_not_of(" \t\r\n");
        if (b == std::string::npos)
        {
            return {};
        }
        const auto e = domain.find_last_not_of(" \t\r\n");
        std::string out = domain.substr(b, e - b + 1);
        for (auto &c : out)
        {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

    bool ValidFqdn(const std::string &domain)
    {
        if (domain.empty() || domain.size() > 253)
        {
            return false;
        }
        if (domain.find('.') == std::string::npos)
        {
            return false;
        }
        for (char c : domain)
        {
            const bool ok = c == '.' || c == '-' || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
            if (!ok)
            {
                return false;
            }
        }
        return true;
    }

    bool CertAuthorizer::AllowedCertDomain(const std::string &caller_ip,
                                           const std::string &domain) const
    {
        const std::string d = NormalizeDomain(domain);
        if (d.empty() || caller_ip.empty())
        {
            return false;
        }
        std::shared_lock<std::shared_mutex> lk(mu_);
        auto it = by_domain_.find(d);
        return it != by_domain_.end() && it->second.count(caller_ip) > 0;
    }

    void CertAuthorizer::SetAllowedDomains(const DomainTable &table)
    {
        std::map<std::string, std::set<std::string>> fresh;
        for (const auto &[domain, ips] : table)
        {
            const std::string d = NormalizeDomain(domain);
            if (d.empty())
            {
                continue;
            }
            std::set<std::string> set;
            for (const auto &ip : ips)
            {
                if (!ip.empty())
                {
                    set.insert(ip);
                }
            }
            if (!set.empty())
            {
                fresh[d].insert(set.begin(), set.end());
            }
        }

        std::unique_lock<std::shared_mutex> lk(mu_);
        by_domain_.swap(fresh);
        LOGD("metadata") << "CertAuthorizer: " << by_domain_.size() << " domain(s) authorized";
    }

    std::vector<std::string> CertAuthorizer::Domains() const
    {
        std::shared_lock<std::shared_mutex> lk(mu_);
        std::vector<std::string> out;
        for (const auto &kv : by_domain_)
        {
            out.push_back(kv.first);
        }
        return out;
    }
} // namespace Metadata
