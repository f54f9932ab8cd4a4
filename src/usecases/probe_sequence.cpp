#include "ipt/runner.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "ipt/resolver.hpp"

namespace ipt {

ProbeSequence::ProbeSequence(Target target,
                             ProbePlan plan,
                             ResolveFn resolve,
                             ConnectFn connect,
                             const std::atomic<bool>* cancel)
    : target_(std::move(target)),
      plan_(plan),
      resolve_(std::move(resolve)),
      connect_(std::move(connect)),
      cancel_(cancel)
{
    if (plan_.attempts < 1) plan_.attempts = 1;
    if (plan_.per_attempt_timeout.count() < 1)
    {
        plan_.per_attempt_timeout = std::chrono::milliseconds(1);
    }
}

void ProbeSequence::resolve_once()
{
    resolved_ = true;
    auto t0 = std::chrono::steady_clock::now();
    try
    {
        addresses_ = resolve_(target_, plan_.deadline);
        if (addresses_.empty())
        {
            resolve_failed_ = true;
            resolve_error_ = "could not resolve " + target_.host + ": no addresses";
        }
        else
        {
            chosen_ = choose_probe_address(addresses_);
        }
    }
    catch (const std::exception& e)
    {
        resolve_failed_ = true;
        resolve_error_ = e.what();
    }
    auto t1 = std::chrono::steady_clock::now();
    resolve_ms_ = std::chrono::duration<double, std::milli>(t1 - t0).count();
}

ProbeAttempt ProbeSequence::stamp(ProbeOutcome outcome, double ms, std::string error)
{
    ProbeAttempt a{};
    a.index = ++emitted_;
    a.outcome = outcome;
    a.ms = std::max(ms, 0.0);
    a.timestamp = std::chrono::system_clock::now();
    a.address = chosen_.ip;
    a.error = std::move(error);
    return a;
}

std::optional<ProbeAttempt> ProbeSequence::next()
{
    if (done()) return std::nullopt;

    if (cancel_ && cancel_->load(std::memory_order_relaxed))
    {
        return stamp(ProbeOutcome::Timeout, 0.0, "request cancelled");
    }
    if (std::chrono::steady_clock::now() >= plan_.deadline)
    {
        return stamp(ProbeOutcome::Timeout, 0.0, "request deadline exceeded");
    }

    const bool first_pull = !resolved_;
    if (first_pull) resolve_once();

    // Resolution may have used up the budget.
    const auto now = std::chrono::steady_clock::now();
    if (now >= plan_.deadline)
    {
        return stamp(ProbeOutcome::Timeout, 0.0, "request deadline exceeded");
    }
    if (resolve_failed_)
    {
        if (first_pull) return stamp(ProbeOutcome::Error, resolve_ms_, resolve_error_);
        return stamp(ProbeOutcome::Error, 0.0, "skipped: " + resolve_error_);
    }

    auto budget = plan_.per_attempt_timeout;
    if (plan_.deadline != std::chrono::steady_clock::time_point::max())
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            plan_.deadline - now);
        budget = std::clamp(left, std::chrono::milliseconds(1), budget);
    }

    ConnectResult c = connect_(chosen_, plan_.port, budget);
    return stamp(c.outcome, c.ms, std::move(c.error));
}

std::vector<ProbeAttempt> run_probes(ProbeSequence& seq, const TryCallback& on_try)
{
    std::vector<ProbeAttempt> attempts;
    attempts.reserve(seq.plan().attempts);
    while (auto a = seq.next())
    {
        if (on_try) on_try(*a);
        attempts.push_back(std::move(*a));
    }
    return attempts;
}

} // namespace ipt
