#pragma once

#include "AddressResolver.hpp"
#include "Types.hpp"

#include <string>
#include <vector>

/**
 * @brief Строит упорядоченный набор правил из политики.
 *
 * Для каждого семейства (IPv4, затем IPv6) порядок такой:
 *  - ACCEPT для адресов записей обхода, в порядке объявления, oifname = outbound_iface;
 *  - ACCEPT для адресов allowlist (control plane), без привязки к интерфейсу;
 *  - DROP всего на outbound_iface, если включён kill switch.
 *
 * Никогда не падает целиком: записи, которые не разрешились, дают ноль правил
 * и попадают в warnings.
 */
class PolicyBuilder
{
public:
    struct Result
    {
        RuleSet                  rules;
        std::vector<std::string> warnings;
    };

    explicit PolicyBuilder(AddressResolver &resolver);

    Result Build(const Policy &policy) const;

private:
    std::vector<ResolvedTarget> ResolveAll_(const std::vector<BypassEntry> &entries,
                                            const char                     *what,
                                            std::vector<std::string>       &warnings) const;

    AddressResolver &resolver_;
};
