#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

struct nft_ctx;

/**
 * @file FirewallRules.hpp
 * @brief Таблица nftables агента: masquerade пода наружу и перенаправление metadata.
 */

/**
 * @brief Исполнитель nft-скриптов.
 */
class NftExecutor
{
public:
    virtual ~NftExecutor() = default;

    /**
     * @brief Выполнить скрипт одной транзакцией.
     * @param script Текст в синтаксисе nft.
     * @param error Текст ошибки nft при неудаче.
     * @return true при успехе.
     */
    virtual bool Run(const std::string &script,
                     std::string       &error) = 0;
};

/**
 * @brief Исполнитель на libnftables.
 */
class LibNftExecutor final : public NftExecutor
{
public:
    LibNftExecutor();
    ~LibNftExecutor() override;

    LibNftExecutor(const LibNftExecutor&)            = delete;
    LibNftExecutor& operator=(const LibNftExecutor&) = delete;

    bool Run(const std::string &script,
             std::string       &error) override;

private:
    nft_ctx *ctx_ = nullptr;
};

class FirewallRules
{
public:
    struct Params
    {
        std::string pod_cidr;                       // "10.99.3.0/24", только IPv4
        std::string bridge_ifname  = "cni0";
        std::string overlay_ifname = "tailscale0";
        std::optional<std::uint16_t> metadata_port; // пусто: без перенаправления metadata
    };

    static constexpr const char *kTableName        = "podweave";
    static constexpr const char *kMasqChain        = "masq";
    static constexpr const char *kRedirectChain    = "metadata-redirect";
    static constexpr const char *kMetadataAddress  = "169.254.169.253";

public:
    explicit FirewallRules(std::unique_ptr<NftExecutor> executor);

    /**
     * @brief Заменить таблицу агента целиком (атомарно).
     * @throws std::invalid_argument при неверных параметрах.
     * @throws std::runtime_error если nft отверг скрипт.
     */
    void Reconcile(const Params &params);

    /**
     * @brief Собрать скрипт для Reconcile(). Чистая функция.
     * @throws std::invalid_argument при неверной подсети или имени интерфейса.
     */
    static std::string BuildRuleset(const Params &params);

private:
    std::unique_ptr<NftExecutor> executor_;
};
