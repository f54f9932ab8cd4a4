#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "ipt/model.hpp"
#include "ipt/options.hpp"

namespace ipt
{
struct SystemLookup
{
    double ms{};
    int rc{};                              // getaddrinfo rc, EAI_AGAIN on deadline
    std::string error;                     // if rc != 0
    std::vector<ResolvedAddress> addresses;
};

// getaddrinfo で 1 回解決。timeout_ms を超えたら rc=EAI_AGAIN を返す
SystemLookup resolve_system_once(const std::string &host, int timeout_ms);

// System resolver first; when it yields no public address, ask the raw DNS
// fallback nameservers and merge. IP targets resolve to themselves.
// Every step is bounded by opt.timeout_ms and by what is left before
// `deadline`. Throws ProbeTransportError when nothing resolves.
std::vector<ResolvedAddress> resolve_target(
    const Target &target,
    const ResolverOptions &opt,
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max());

// Per-query timeout for the raw DNS fallback: A and AAAA, each possibly
// tried against every nameserver, must fit in remaining_ms.
int fallback_query_timeout_ms(int timeout_ms, int remaining_ms, std::size_t nameservers);

// First public address, else the first one; empty ip when none.
ResolvedAddress choose_probe_address(const std::vector<ResolvedAddress> &addrs);
} // namespace ipt
