#pragma once

// NetWatcher.hpp - следит за link/addr/route через netlink (rtnetlink multicast)
// и после затишья (debounce) сообщает владельцу, что сетевое окружение изменилось.
// Сам правила не применяет: только поднимает флаг у ConnectionSupervisor.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>

struct nl_sock;

class NetWatcher
{
public:
    using ChangedFn = std::function<void()>;

    /**
     * @brief Подписаться на RTNLGRP_LINK / IPV4_IFADDR / IPV6_IFADDR / IPV4_ROUTE / IPV6_ROUTE
     * и запустить фоновый поток.
     * @throws std::runtime_error если netlink или eventfd недоступны.
     */
    explicit NetWatcher(ChangedFn on_changed,
                        std::chrono::milliseconds debounce = std::chrono::milliseconds(2000));

    ~NetWatcher();

    NetWatcher(const NetWatcher&)            = delete;
    NetWatcher& operator=(const NetWatcher&) = delete;

    // Внешнее событие; склеивается с netlink-событиями в одно уведомление.
    void Kick();

    void Stop();

private:
    struct SockDeleter { void operator()(nl_sock *s) const; };

    void ThreadLoop_(std::stop_token st);
    bool WaitQuiet_(std::stop_token st);
    void Notify_();

    static void Signal_(int fd);
    static void Drain_(int fd);

private:
    ChangedFn                 on_changed_;
    std::chrono::milliseconds debounce_;

    std::unique_ptr<nl_sock, SockDeleter> sock_;
    int nl_fd_   = -1;
    int stop_fd_ = -1;
    int kick_fd_ = -1;

    std::jthread thread_;
};
