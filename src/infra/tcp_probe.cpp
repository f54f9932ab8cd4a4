#include "ipt/probe.hpp"

#include <cerrno>
#include <chrono>
#include <string>
#include <system_error>

// POSIX networking
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ipt
{
namespace
{
struct FdCloser
{
    int fd;
    ~FdCloser() { if (fd >= 0) ::close(fd); }
};

ProbeOutcome classify_errno(int err)
{
    switch (err)
    {
        case 0: return ProbeOutcome::Success;
        case ECONNREFUSED: return ProbeOutcome::Refused;
        case ETIMEDOUT: return ProbeOutcome::Timeout;
        default: return ProbeOutcome::Error;
    }
}

bool fill_sockaddr(const ResolvedAddress &addr,
                   uint16_t port,
                   sockaddr_storage &ss,
                   socklen_t &len)
{
    if (addr.af == AF_INET)
    {
        auto *sin = reinterpret_cast<sockaddr_in *>(&ss);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port);
        len = sizeof(sockaddr_in);
        return inet_pton(AF_INET, addr.ip.c_str(), &sin->sin_addr) == 1;
    }
    if (addr.af == AF_INET6)
    {
        auto *sin6 = reinterpret_cast<sockaddr_in6 *>(&ss);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        len = sizeof(sockaddr_in6);
        return inet_pton(AF_INET6, addr.ip.c_str(), &sin6->sin6_addr) == 1;
    }
    return false;
}
} // namespace

ConnectResult tcp_connect_once(const ResolvedAddress &addr,
                               uint16_t port,
                               std::chrono::milliseconds timeout)
{
    using clock = std::chrono::steady_clock;
    ConnectResult r{};
    const auto t0 = clock::now();
    auto finish = [&](ProbeOutcome outcome, int err)
    {
        r.ms = std::chrono::duration<double, std::milli>(clock::now() - t0).count();
        r.outcome = outcome;
        if (outcome == ProbeOutcome::Timeout && err == 0)
        {
            r.error = "no response within " + std::to_string(timeout.count()) + " ms";
        }
        else if (err != 0)
        {
            r.error = std::system_category().message(err);
        }
        return r;
    };

    sockaddr_storage ss{};
    socklen_t len = 0;
    if (!fill_sockaddr(addr, port, ss, len))
    {
        r.error = "unusable address: " + addr.ip;
        return r;
    }

    const int fd = ::socket(addr.af, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) return finish(ProbeOutcome::Error, errno);
    FdCloser guard{fd};

    if (::connect(fd, reinterpret_cast<sockaddr *>(&ss), len) == 0)
    {
        return finish(ProbeOutcome::Success, 0);
    }
    if (errno != EINPROGRESS)
    {
        const int err = errno;
        return finish(classify_errno(err), err);
    }

    const auto deadline = t0 + timeout;
    for (;;)
    {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - clock::now());
        if (remaining.count() <= 0) return finish(ProbeOutcome::Timeout, 0);

        pollfd pfd{fd, POLLOUT, 0};
        const int pr = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (pr < 0)
        {
            if (errno == EINTR) continue;
            const int err = errno;
            return finish(ProbeOutcome::Error, err);
        }
        if (pr == 0) return finish(ProbeOutcome::Timeout, 0);
        break;
    }

    int soerr = 0;
    socklen_t sl = sizeof(soerr);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soerr, &sl) < 0) soerr = errno;
    return finish(classify_errno(soerr), soerr);
}

const char *outcome_str(ProbeOutcome o)
{
    switch (o)
    {
        case ProbeOutcome::Success: return "success";
        case ProbeOutcome::Timeout: return "timeout";
        case ProbeOutcome::Refused: return "refused";
        case ProbeOutcome::Error: return "error";
    }
    return "error";
}
} // namespace ipt
