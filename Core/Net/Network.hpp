#pragma once

#include <cstdint>
#include <string>

/**
 * @file Network.hpp
 * @brief Низкоуровневые сетевые помощники: CIDR IPv4, sysctl, netlink, nftables.
 */

// Скрываем libnl из заголовка.
struct nl_sock;

namespace NetConfig
{
    /**
     * @brief CIDR-блок IPv4.
     */
    struct CidrV4
    {
        std::uint32_t addr_be = 0; ///< Адрес в big-endian (network byte order).
        std::uint8_t  prefix  = 0; ///< Длина префикса (0..32).
    };

    /**
     * @brief Разобрать "a.b.c.d/len". Без "/len" считается /32.
     * @return false при неверном адресе или префиксе (IPv6 тоже false).
     */
    bool parse_cidr4(const std::string &s,
                     CidrV4            &out);

    /**
     * @brief Разобрать адрес IPv4 в big-endian.
     */
    bool parse_ipv4(const std::string &s,
                    std::uint32_t     &out_be);

    /// true, если строка является литералом IPv4 или IPv6.
    bool is_ip_literal(const std::string &s);

    /// Маска сети в big-endian для префикса.
    std::uint32_t netmask_be(std::uint8_t prefix);

    /**
     * @brief Сетевой адрес блока в виде "a.b.c.d/len" (хостовые биты обнулены).
     */
    std::string to_network_cidr(const CidrV4 &c);

    /**
     * @brief Первый адрес хоста в сети (сеть + 1), без префикса.
     */
    std::string first_host(const CidrV4 &c);

    /**
     * @brief Проверить, что адрес IPv4 лежит внутри блока.
     * @return false, если ip не литерал IPv4.
     */
    bool cidr4_contains(const CidrV4      &c,
                        const std::string &ip);

    /**
     * @brief Записать значение в sysctl-файл.
     * @param path Путь к файлу.
     * @param val Значение.
     * @return true при успехе.
     */
    bool write_sysctl(const char *path,
                      const char *val);

    /**
     * @brief Открыть и подключить NETLINK_ROUTE сокет libnl.
     * @return nullptr при ошибке. Освобождать через nl_socket_free().
     */
    nl_sock *nl_connect_route();

    /**
     * @brief Проверить, что libnftables может работать с ядром.
     */
    bool nft_feature_probe();
} // namespace NetConfig
