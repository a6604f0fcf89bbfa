#pragma once

#include "Core/Kube/Types.hpp"

#include <string>

/**
 * @file ServiceName.hpp
 * @brief Имя overlay-сервиса для Service Kubernetes.
 */

namespace Serve
{
    /// Префикс имени сервиса в serve-config и AdvertiseServices.
    inline constexpr const char *kServicePrefix = "svc:";

    /// Имя по умолчанию, если санитизация дала пустую строку.
    inline constexpr const char *kFallbackName = "k8s-svc";

    /**
     * @brief Привести строку к DNS-метке: нижний регистр, [a-z0-9-], не длиннее 63,
     *        без '-' по краям. Может вернуть пустую строку.
     */
    std::string DnsLabelSanitize(const std::string &s);

    /// "k8s-<ns>-<name>" после санитизации, либо kFallbackName.
    std::string DefaultServiceName(const std::string &ns,
                                   const std::string &name);

    /**
     * @brief Полное имя "svc:<bare>".
     *
     * bare берётся из аннотации annotation_key (обрезаются пробелы), иначе DefaultServiceName().
     * @return Пустая строка, если аннотация состоит из одних пробелов.
     */
    std::string ServiceName(const Kube::Service &svc,
                            const std::string   &annotation_key);

    /// Имя без префикса "svc:".
    std::string WithoutPrefix(const std::string &name);
} // namespace Serve
