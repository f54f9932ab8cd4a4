#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "ipt/model.hpp"

namespace ipt
{
// Result of one connect, before the runner stamps index/timestamp/address.
struct ConnectResult
{
    ProbeOutcome outcome{ProbeOutcome::Error};
    double ms{};
    std::string error;
};

// Non-blocking TCP connect bounded by `timeout`.
// established -> Success, ECONNREFUSED -> Refused, no answer -> Timeout,
// everything else -> Error.
ConnectResult tcp_connect_once(const ResolvedAddress &addr,
                               uint16_t port,
                               std::chrono::milliseconds timeout);

const char *outcome_str(ProbeOutcome o);
} // namespace ipt
