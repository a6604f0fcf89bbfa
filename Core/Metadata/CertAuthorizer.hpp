#pragma once

#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Metadata
{
    /// Обрезать пробелы, нижний регистр.
    std::string NormalizeDomain(const std::string &domain);

    /// Непусто, не длиннее 253, есть точка, только [a-z0-9.-].
    bool ValidFqdn(const std::string &domain);

    /**
     * @brief Таблица "домен -> адреса подов", которым разрешено получать сертификат домена.
     *
     * Заменяется целиком; читатели никогда не видят частично обновлённую таблицу.
     */
    class CertAuthorizer
    {
    public:
        using DomainTable = std::map<std::string, std::vector<std::string>>;

        bool AllowedCertDomain(const std::string &caller_ip,
                               const std::string &domain) const;

        /// Пустые адреса отбрасываются, домены без адресов не попадают в таблицу.
        void SetAllowedDomains(const DomainTable &table);

        std::vector<std::string> Domains() const;

    private:
        mutable std::shared_mutex                        mu_;
        std::map<std::string, std::set<std::string>>     by_domain_;
    };
} // namespace Metadata
