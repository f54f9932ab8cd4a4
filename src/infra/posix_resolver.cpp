#include "ipt/resolver.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

// POSIX networking
#include <netdb.h>
#include <arpa/inet.h>
#include <sys/socket.h>

#include <spdlog/spdlog.h>

#include "ipt/concurrency.hpp"
#include "ipt/errors.hpp"
#include "ipt/rawdns.hpp"
#include "ipt/target.hpp"

namespace ipt
{
static std::vector<ResolvedAddress> collect_addresses(const addrinfo *res)
{
    std::vector<ResolvedAddress> out;
    std::unordered_set<std::string> seen;
    char buf[INET6_ADDRSTRLEN]{};
    for (const addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
    {
        ResolvedAddress a{};
        a.af = ai->ai_family;
        if (ai->ai_family == AF_INET)
        {
            const auto *sin = reinterpret_cast<const sockaddr_in *>(ai->
                ai_addr);
            if (inet_ntop(
                AF_INET,
                &sin->sin_addr,
                buf,
                sizeof(buf))) a.ip = buf;
        }
        else if (ai->ai_family == AF_INET6)
        {
            const auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(ai->
                ai_addr);
            if (inet_ntop(
                AF_INET6,
                &sin6->sin6_addr,
                buf,
                sizeof(buf))) a.ip = buf;
        }
        else
        {
            continue;
        }
        if (a.ip.empty() || !seen.insert(a.ip).second) continue;
        out.push_back(std::move(a));
    }
    return out;
}

static SystemLookup getaddrinfo_once(const std::string &host)
{
    SystemLookup result{};

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_ADDRCONFIG;

    addrinfo *res = nullptr;
    auto t0 = std::chrono::steady_clock::now();
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
    auto t1 = std::chrono::steady_clock::now();
    result.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    result.rc = rc;

    if (rc != 0)
    {
        result.error = gai_strerror(rc);
        if (res) freeaddrinfo(res);
        return result;
    }

    result.addresses = collect_addresses(res);
    if (res) freeaddrinfo(res);
    return result;
}

// Abandoned getaddrinfo calls keep running on their detached threads;
// this bounds how many can pile up behind a stuck resolver.
constexpr int kMaxSystemLookupsInFlight = 64;

static InFlightLimit &system_lookup_limit()
{
    static InFlightLimit limit(kMaxSystemLookupsInFlight);
    return limit;
}

SystemLookup resolve_system_once(const std::string &host, int timeout_ms)
{
    auto slot = system_lookup_limit().try_acquire();
    if (!slot)
    {
        spdlog::warn("resolve host={} refused: {} system lookups in flight",
                     host, system_lookup_limit().in_flight());
        SystemLookup busy{};
        busy.rc = EAI_AGAIN;
        busy.error = "too many system resolver lookups in flight";
        return busy;
    }

    auto t0 = std::chrono::steady_clock::now();
    std::optional<SystemLookup> r = call_with_timeout<SystemLookup>(
        [host, slot] { return getaddrinfo_once(host); },
        std::chrono::milliseconds(std::max(timeout_ms, 1)));
    if (r) return *r;

    SystemLookup timed_out{};
    timed_out.ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    timed_out.rc = EAI_AGAIN;
    timed_out.error = "system resolver timed out after " +
                      std::to_string(timeout_ms) + " ms";
    return timed_out;
}

int fallback_query_timeout_ms(int timeout_ms, int remaining_ms, std::size_t nameservers)
{
    const int queries = 2 * static_cast<int>(std::max<std::size_t>(nameservers, 1));
    return std::max(1, std::min(timeout_ms, remaining_ms / queries));
}

static int remaining_ms(std::chrono::steady_clock::time_point deadline)
{
    if (deadline == std::chrono::steady_clock::time_point::max())
    {
        return std::numeric_limits<int>::max();
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return static_cast<int>(std::clamp<long long>(left, 0, std::numeric_limits<int>::max()));
}

static bool has_public(const std::vector<ResolvedAddress> &addrs)
{
    return std::ranges::any_of(
        addrs,
        [](const ResolvedAddress &a) { return is_public_address(a.ip); });
}

std::vector<ResolvedAddress> resolve_target(const Target &target,
                                            const ResolverOptions &opt,
                                            std::chrono::steady_clock::time_point deadline)
{
    if (target.kind == TargetKind::Ip)
    {
        return {ResolvedAddress{target.af, target.host}};
    }

    int left = remaining_ms(deadline);
    if (left <= 0)
    {
        throw ProbeTransportError(
            "could not resolve " + target.host + ": request deadline exceeded");
    }

    SystemLookup sys = resolve_system_once(target.host, std::min(opt.timeout_ms, left));
    std::vector<ResolvedAddress> addrs = sys.addresses;
    spdlog::debug("resolve host={} system_rc={} addresses={} ms={:.3f}",
                  target.host, sys.rc, addrs.size(), sys.ms);
    if (has_public(addrs) || opt.nameservers.empty())
    {
        if (addrs.empty())
        {
            throw ProbeTransportError(
                "could not resolve " + target.host + ": " + sys.error);
        }
        return addrs;
    }

    left = remaining_ms(deadline);
    if (left <= 0)
    {
        if (!addrs.empty()) return addrs;
        std::string why = sys.error.empty() ? "no addresses" : sys.error;
        throw ProbeTransportError("could not resolve " + target.host + ": " + why +
                                  "; request deadline exceeded");
    }

    RawDnsResult rd = resolve_rawdns_once(
        target.host,
        opt.nameservers,
        fallback_query_timeout_ms(opt.timeout_ms, left, opt.nameservers.size()));
    spdlog::debug("resolve host={} fallback_rc={} addresses={} ms={:.3f}",
                  target.host, rd.rc, rd.addresses.size(), rd.ms);
    for (auto &a: rd.addresses)
    {
        const bool dup = std::ranges::any_of(
            addrs,
            [&](const ResolvedAddress &b) { return b.ip == a.ip; });
        if (!dup) addrs.push_back(std::move(a));
    }

    if (addrs.empty())
    {
        std::string why = sys.error.empty() ? "no addresses" : sys.error;
        if (!rd.error.empty()) why += "; fallback: " + rd.error;
        throw ProbeTransportError("could not resolve " + target.host + ": " + why);
    }
    return addrs;
}

ResolvedAddress choose_probe_address(const std::vector<ResolvedAddress> &addrs)
{
    for (const auto &a: addrs)
    {
        if (is_public_address(a.ip)) return a;
    }
    if (!addrs.empty()) return addrs.front();
    return {};
}
} // namespace ipt
