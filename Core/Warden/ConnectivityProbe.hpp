#pragma once

// ConnectivityProbe.hpp - проверка доступности через туннель: HEAD по списку URL,
// N попыток с паузой между ними (после последней паузы нет), отмена по stop_token.

#include "Types.hpp"

#include <chrono>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

class HttpChecker
{
public:
    virtual ~HttpChecker() = default;

    /**
     * @brief Один запрос с ограничением по времени.
     * @throws ProbeTransportError при ошибке соединения/таймауте/разборе ответа.
     * @return HTTP-статус ответа.
     */
    virtual int Head(const std::string &url, std::chrono::milliseconds timeout) = 0;
};

// Boost.Beast поверх Asio; https через asio::ssl (OpenSSL) с проверкой сертификата.
class BeastHttpChecker final : public HttpChecker
{
public:
    int Head(const std::string &url, std::chrono::milliseconds timeout) override;
};

// Пауза с отменой; false - прервано.
using SleepFn = std::function<bool(std::chrono::milliseconds, std::stop_token)>;

bool InterruptibleSleep(std::chrono::milliseconds duration, std::stop_token st);

StatusClass ClassifyStatus(int http_status);

class ConnectivityProbe
{
public:
    ConnectivityProbe(HttpChecker              &checker,
                      SleepFn                   sleep           = InterruptibleSleep,
                      std::chrono::milliseconds request_timeout = std::chrono::seconds(2));

    /**
     * @brief Одна попытка по одному URL.
     */
    ProbeResult ProbeOnce(const std::string &endpoint);

    /**
     * @brief true при первом успешном URL в любой попытке.
     * Между попытками - sleep(interval), после последней - нет.
     * Отмена через st: немедленный выход с false.
     */
    bool Check(const std::vector<std::string> &endpoints,
               int                             max_attempts,
               std::chrono::milliseconds       interval,
               std::stop_token                 st);

private:
    HttpChecker              &checker_;
    SleepFn                   sleep_;
    std::chrono::milliseconds timeout_;
};
