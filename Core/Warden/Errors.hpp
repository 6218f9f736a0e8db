#pragma once

#include "Types.hpp"

#include <stdexcept>
#include <string>

// Имя хоста не разрешилось; не фатально, сокращает покрытие обхода.
class ResolutionFailed : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Не удалось применить правила для семейства; IPv4 - фатально.
class RuleApplyFailed : public std::runtime_error
{
public:
    RuleApplyFailed(IpFamily family, const std::string &what)
        : std::runtime_error(std::string(ToString(family)) + ": " + what)
        , family_(family)
    {
    }

    IpFamily Family() const { return family_; }

private:
    IpFamily family_;
};

// Транспортная ошибка проверки; обрабатывается как неуспешная проверка.
class ProbeTransportError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Без валидного конфига туннеля выйти из RECONNECTING нельзя.
class ConfigRegenerationFailed : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
