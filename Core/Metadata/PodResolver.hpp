#pragma once

#include "Core/Kube/Store.hpp"
#include "Core/Kube/Types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace Metadata
{
    /**
     * @brief Поиск пода по адресу для журнала аудита.
     */
    class PodResolver
    {
    public:
        virtual ~PodResolver() = default;

        /// (namespace, name) пода с этим адресом.
        virtual std::optional<std::pair<std::string, std::string>> PodForIP(const std::string &ip) const = 0;
    };

    /**
     * @brief Поиск по кэшу подов узла.
     */
    class StorePodResolver final : public PodResolver
    {
    public:
        explicit StorePodResolver(const Kube::Store<Kube::Pod> &store) : store_(store) {}

        std::optional<std::pair<std::string, std::string>> PodForIP(const std::string &ip) const override
        {
            if (ip.empty())
            {
                return std::nullopt;
            }
            for (const auto &pod : store_.List())
            {
                if (pod.pod_ip == ip)
                {
                    return std::make_pair(pod.ns, pod.name);
                }
            }
            return std::nullopt;
        }

    private:
        const Kube::Store<Kube::Pod> &store_;
    };
} // namespace Metadata
