#pragma once

// Config.hpp - доступ к полям JSON-конфига (Boost.JSON) и к переменным окружения.
// Require* бросают std::runtime_error, если поля нет или тип не тот.

#include <boost/json.hpp>

#include <optional>
#include <string>

namespace Config
{
    std::string RequireString(const boost::json::object &o, const char *key);
    int         RequireInt(const boost::json::object &o, const char *key);
    bool        RequireBool(const boost::json::object &o, const char *key);

    std::optional<std::string> OptionalString(const boost::json::object &o, const char *key);
    std::optional<int>         OptionalInt(const boost::json::object &o, const char *key);
    std::optional<bool>        OptionalBool(const boost::json::object &o, const char *key);

    // Значение переменной окружения; пустая строка считается отсутствием.
    std::optional<std::string> Env(const char *name);

    /**
     * @brief Разбор булева значения в стиле env: 1/0, true/false, yes/no, on/off.
     * @throws std::invalid_argument для нераспознанной строки.
     */
    bool ParseBool(const std::string &text);

    /**
     * @brief Разбор целого числа с проверкой диапазона.
     * @throws std::invalid_argument если строка не число или вне [min_v..max_v].
     */
    int ParseInt(const std::string &text, int min_v, int max_v);
}
