#include "NetWatcher.hpp"
#include "Core/Logger.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <netlink/netlink.h>
#include <netlink/socket.h>
#include <netlink/msg.h>
#include <netlink/handlers.h>
#include <linux/rtnetlink.h>

namespace
{
    int OnNlMessage(struct nl_msg * /*msg*/, void *arg)
    {
        static_cast<NetWatcher *>(arg)->Kick();
        return NL_OK;
    }

    int MakeEventFd()
    {
        int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (fd < 0)
            throw std::runtime_error(std::string("eventfd: ") + std::strerror(errno));
        return fd;
    }
}

void NetWatcher::SockDeleter::operator()(nl_sock *s) const
{
    if (s)
    {
        nl_close(s);
        nl_socket_free(s);
    }
}

void NetWatcher::Signal_(int fd)
{
    if (fd < 0) return;
    const std::uint64_t one = 1;
    // счётчик eventfd переполниться не может на практике; EAGAIN значит «уже взведён»
    if (::write(fd, &one, sizeof(one)) < 0 && errno != EAGAIN)
    {
        LOGD("netwatcher") << "eventfd write: " << std::strerror(errno);
    }
}

void NetWatcher::Drain_(int fd)
{
    std::uint64_t v = 0;
    while (::read(fd, &v, sizeof(v)) > 0 || errno == EINTR)
    {
    }
}

NetWatcher::NetWatcher(ChangedFn on_changed, std::chrono::milliseconds debounce)
    : on_changed_(std::move(on_changed))
    , debounce_(debounce.count() > 0 ? debounce : std::chrono::milliseconds(2000))
{
    if (!on_changed_) throw std::invalid_argument("NetWatcher: callback is empty");

    sock_.reset(nl_socket_alloc());
    if (!sock_) throw std::runtime_error("nl_socket_alloc failed");

    int rc = nl_connect(sock_.get(), NETLINK_ROUTE);
    if (rc != 0) throw std::runtime_error(std::string("nl_connect: ") + nl_geterror(rc));

    rc = nl_socket_add_memberships(sock_.get(),
                                   RTNLGRP_LINK,
                                   RTNLGRP_IPV4_IFADDR,
                                   RTNLGRP_IPV6_IFADDR,
                                   RTNLGRP_IPV4_ROUTE,
                                   RTNLGRP_IPV6_ROUTE,
                                   0);
    if (rc != 0) throw std::runtime_error(std::string("nl_socket_add_memberships: ") + nl_geterror(rc));

    nl_socket_disable_seq_check(sock_.get());
    nl_socket_modify_cb(sock_.get(), NL_CB_VALID, NL_CB_CUSTOM, &OnNlMessage, this);
    nl_socket_set_nonblocking(sock_.get());
    nl_fd_ = nl_socket_get_fd(sock_.get());

    stop_fd_ = MakeEventFd();
    try
    {
        kick_fd_ = MakeEventFd();
    }
    catch (...)
    {
        ::close(stop_fd_);
        throw;
    }

    thread_ = std::jthread([this](std::stop_token st) { ThreadLoop_(st); });
    LOGD("netwatcher") << "Armed (debounce=" << debounce_.count() << " ms)";
}

NetWatcher::~NetWatcher()
{
    Stop();
    if (stop_fd_ >= 0) ::close(stop_fd_);
    if (kick_fd_ >= 0) ::close(kick_fd_);
}

void NetWatcher::Kick()
{
    Signal_(kick_fd_);
}

void NetWatcher::Stop()
{
    if (!thread_.joinable()) return;
    thread_.request_stop();
    Signal_(stop_fd_);
    thread_.join();
    LOGD("netwatcher") << "Stopped";
}

// Ждать, пока события не затихнут на debounce_. false - пришла остановка.
bool NetWatcher::WaitQuiet_(std::stop_token st)
{
    auto last = std::chrono::steady_clock::now();
    while (!st.stop_requested())
    {
        const auto left = debounce_ - (std::chrono::steady_clock::now() - last);
        if (left <= std::chrono::steady_clock::duration::zero()) return true;

        pollfd p[3] = {
            { stop_fd_, POLLIN, 0 },
            { kick_fd_, POLLIN, 0 },
            { nl_fd_,   POLLIN, 0 },
        };
        const int ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(left).count()) + 1;
        const int rc = ::poll(p, 3, ms);
        if (rc < 0)
        {
            if (errno == EINTR) continue;
            LOGE("netwatcher") << "poll: " << std::strerror(errno);
            return false;
        }
        if (rc == 0) return true;
        if (p[0].revents & POLLIN) return false;

        if (p[2].revents & POLLIN) nl_recvmsgs_default(sock_.get());
        if (p[1].revents & POLLIN)
        {
            Drain_(kick_fd_);
            last = std::chrono::steady_clock::now();
        }
    }
    return false;
}

void NetWatcher::Notify_()
{
    try
    {
        on_changed_();
    }
    catch (const std::exception &e)
    {
        LOGE("netwatcher") << "Change handler failed: " << e.what();
    }
}

void NetWatcher::ThreadLoop_(std::stop_token st)
{
    LOGI("netwatcher") << "Thread started";

    while (!st.stop_requested())
    {
        pollfd p[3] = {
            { stop_fd_, POLLIN, 0 },
            { kick_fd_, POLLIN, 0 },
            { nl_fd_,   POLLIN, 0 },
        };
        const int rc = ::poll(p, 3, -1);
        if (rc < 0)
        {
            if (errno == EINTR) continue;
            LOGE("netwatcher") << "poll: " << std::strerror(errno);
            break;
        }
        if (p[0].revents & POLLIN) break;

        // OnNlMessage превращает каждое сообщение в Kick()
        if (p[2].revents & POLLIN) nl_recvmsgs_default(sock_.get());
        if (!(p[1].revents & POLLIN)) continue;

        Drain_(kick_fd_);
        if (!WaitQuiet_(st)) break;

        LOGI("netwatcher") << "Network changed";
        Notify_();
    }

    LOGI("netwatcher") << "Thread exiting";
}
