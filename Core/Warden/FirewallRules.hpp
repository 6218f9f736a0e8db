#pragma once

// FirewallRules.hpp - применение RuleSet к nftables (libnftables), по одному семейству.
// Каждое применение заменяет нашу таблицу целиком одной транзакцией nft:
// повторное применение не копит правила, а при ошибке ядро оставляет прежний набор.

#include "Types.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Примитивы ядра, которые нужны FirewallRules.
 */
class FirewallBackend
{
public:
    virtual ~FirewallBackend() = default;

    // Выполнить пакет команд nft атомарно; бросает std::runtime_error при ошибке.
    virtual void Run(const std::string &script) = 0;

    virtual bool InterfaceExists(const std::string &ifname) = 0;

    // Есть ли у ядра стек семейства (IPv6 может быть выключен целиком).
    virtual bool FamilySupported(IpFamily family) = 0;
};

// libnftables + libnl
class NftBackend final : public FirewallBackend
{
public:
    NftBackend();
    ~NftBackend() override;

    NftBackend(const NftBackend&)            = delete;
    NftBackend& operator=(const NftBackend&) = delete;

    void Run(const std::string &script) override;
    bool InterfaceExists(const std::string &ifname) override;
    bool FamilySupported(IpFamily family) override;

private:
    struct nft_ctx* ctx_ = nullptr;
};

class FirewallRules
{
public:
    struct Params
    {
        std::string table_name    = "warden";
        std::string chain_name    = "egress";
        int         hook_priority = 0;
    };

    struct Report
    {
        bool        v4_applied = false;
        bool        v6_applied = false;
        std::size_t v4_rules   = 0;
        std::size_t v6_rules   = 0;
        std::vector<std::string> warnings;
    };

public:
    FirewallRules(const Params &params, FirewallBackend &backend);
    ~FirewallRules() = default;

    FirewallRules(const FirewallRules&)            = delete;
    FirewallRules& operator=(const FirewallRules&) = delete;

    /**
     * @brief Заменить ранее применённые правила новым набором.
     *
     * Вызовы сериализуются мьютексом: второй вызов ждёт окончания первого.
     * IPv6: ошибка или отсутствие стека - предупреждение в Report.
     *
     * @param rules Набор правил (оба семейства).
     * @param outbound_iface Интерфейс из политики; должен существовать.
     * @throws RuleApplyFailed(V4) если интерфейса нет или IPv4-транзакция не прошла.
     */
    Report Apply(const RuleSet &rules, const std::string &outbound_iface);

    // Удалить наши таблицы обоих семейств (идемпотентно).
    void Revert();

    bool Applied() const;

    // Текст транзакции nft для одного семейства.
    static std::string Render(const Params &params, IpFamily family, const RuleSet &rules);

private:
    static std::string RenderRule_(const Params &params, const Rule &rule);

private:
    Params             p_;
    FirewallBackend   &backend_;
    mutable std::mutex mu_;
    bool               applied_v4_ = false;
    bool               applied_v6_ = false;
};
