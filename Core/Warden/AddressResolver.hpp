#pragma once

// AddressResolver.hpp - разрешение записи обхода в адреса на момент применения правил.
// Кэша нет (в том числе негативного): каждый цикл резолвит заново.

#include "Types.hpp"

#include <set>

class AddressResolver
{
public:
    virtual ~AddressResolver() = default;

    /**
     * @brief Литерал IP/CIDR возвращается как есть, имя хоста - A и AAAA.
     * @throws ResolutionFailed если имя не разрешилось или ответ пуст.
     */
    virtual std::set<Destination> Resolve(const BypassEntry &entry) = 0;
};

// Системный резолвер (getaddrinfo через Boost.Asio).
class SystemResolver final : public AddressResolver
{
public:
    std::set<Destination> Resolve(const BypassEntry &entry) override;
};
