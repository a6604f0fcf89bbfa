#pragma once

#include "Core/Overlay/Types.hpp"

#include <string>
#include <vector>

/**
 * @file Codec.hpp
 * @brief Преобразование JSON LocalAPI <-> типы Overlay.
 *
 * Decode* терпимы к отсутствующим полям; ошибкой считается только неверный тип корня.
 */

namespace Overlay
{
    Status DecodeStatus(const boost::json::value &v);

    Prefs DecodePrefs(const boost::json::value &v);

    boost::json::object EncodeMaskedPrefs(const MaskedPrefs &mp);

    WhoIs DecodeWhoIs(const boost::json::value &v);

    /**
     * @brief Разделить ответ cert?type=pair на ключ и сертификат.
     *
     * Ответ: PEM ключа, затем PEM сертификата. Граница ищется по первому "--\n--".
     * @throws Overlay::Error если граница не найдена или во второй половине есть приватный ключ.
     */
    CertPair SplitCertPair(const std::string &body);

    boost::json::object EncodeServiceConfig(const ServiceConfig &sc);

    ServiceConfig DecodeServiceConfig(const boost::json::value &v);

    /// Имена в "Services" документа serve-config.
    std::vector<std::string> ServeServiceNames(const ServeConfig &cfg);

    /// Записать сервис целиком (старое содержимое заменяется).
    void UpsertServeService(ServeConfig         &cfg,
                            const std::string   &name,
                            const ServiceConfig &sc);

    /// @return true, если сервис был и удалён.
    bool RemoveServeService(ServeConfig       &cfg,
                            const std::string &name);
} // namespace Overlay
