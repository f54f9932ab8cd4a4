#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "ipt/model.hpp"
#include "ipt/probe.hpp"

namespace ipt {

// May throw (ProbeTransportError) when the name does not resolve. Must
// give up by `deadline` (time_point::max() when unbounded).
using ResolveFn = std::function<std::vector<ResolvedAddress>(
    const Target&, std::chrono::steady_clock::time_point /*deadline*/)>;
using ConnectFn = std::function<ConnectResult(const ResolvedAddress&,
                                              uint16_t /*port*/,
                                              std::chrono::milliseconds /*timeout*/)>;

struct ProbePlan {
    int attempts = 3;
    std::chrono::milliseconds per_attempt_timeout{1000};
    uint16_t port = 443;
    std::chrono::steady_clock::time_point deadline =
        std::chrono::steady_clock::time_point::max();
};

// Lazy, finite, single-pass sequence of attempts against one target.
// The target is resolved once, on the first pull, and the chosen address is
// reused for every attempt. Resolution shares the request deadline. A
// resolution failure turns every attempt into an Error. Once the deadline
// passes or *cancel trips, the remaining attempts come out as Timeout
// without touching the network.
class ProbeSequence {
public:
    ProbeSequence(Target target,
                  ProbePlan plan,
                  ResolveFn resolve,
                  ConnectFn connect,
                  const std::atomic<bool>* cancel = nullptr);

    ProbeSequence(const ProbeSequence&) = delete;
    ProbeSequence& operator=(const ProbeSequence&) = delete;

    std::optional<ProbeAttempt> next();
    bool done() const { return emitted_ >= plan_.attempts; }

    const Target& target() const { return target_; }
    const ProbePlan& plan() const { return plan_; }
    const std::vector<ResolvedAddress>& resolved() const { return addresses_; }
    const ResolvedAddress& probe_address() const { return chosen_; }
    const std::string& resolve_error() const { return resolve_error_; }

private:
    void resolve_once();
    ProbeAttempt stamp(ProbeOutcome outcome, double ms, std::string error);

    Target target_;
    ProbePlan plan_;
    ResolveFn resolve_;
    ConnectFn connect_;
    const std::atomic<bool>* cancel_;

    bool resolved_ = false;
    bool resolve_failed_ = false;
    std::string resolve_error_;
    double resolve_ms_ = 0.0;
    std::vector<ResolvedAddress> addresses_;
    ResolvedAddress chosen_;
    int emitted_ = 0;
};

// per-try コールバック（1 トライ完了ごとに呼ばれる）
using TryCallback = std::function<void(const ProbeAttempt&)>;

// Drain the sequence in order; returns every attempt.
std::vector<ProbeAttempt> run_probes(ProbeSequence& seq,
                                     const TryCallback& on_try = {});

} // namespace ipt
