#pragma once

// PolicyInput.hpp - разбор операторского ввода политики:
// списки "a.com;b.org,10.0.0.0/8", нормализация записей, IP/CIDR-литералы.

#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace PolicyInput
{
    /**
     * @brief Разбить строку по любому из разделителей; пустые токены отбрасываются,
     * пробелы по краям обрезаются.
     */
    std::vector<std::string> Split(const std::string &text, const std::string &delims);

    /**
     * @brief Нормализовать запись: убрать "scheme://", путь "/...", порт и [скобки].
     * Суффикс "/N" у IP-литерала сохраняется как префикс CIDR.
     * @return std::nullopt для пустой записи.
     */
    std::optional<BypassEntry> Normalize(const std::string &token);

    /**
     * @brief Разобрать список записей (разделители ';' и ','), без дублей,
     * в порядке первого появления.
     */
    std::vector<BypassEntry> ParseList(const std::string &text);

    /**
     * @brief IP или CIDR-литерал в каноническом виде.
     * @return std::nullopt, если это не литерал (т.е. имя хоста) или префикс неверен.
     */
    std::optional<Destination> ParseLiteral(const std::string &text);

    bool IsIpLiteral(const std::string &text);

    std::string StripBrackets(const std::string &s);
}
