#include "ipt/service.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "ipt/aggregate.hpp"
#include "ipt/errors.hpp"
#include "ipt/probe.hpp"
#include "ipt/resolver.hpp"
#include "ipt/target.hpp"

namespace ipt {

int64_t epoch_ms_now()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

RequestTiming compute_timing(int64_t server_received_epoch_ms,
                             std::optional<int64_t> client_sent_epoch_ms)
{
    RequestTiming t{};
    t.server_received_epoch_ms = server_received_epoch_ms;
    t.client_sent_epoch_ms = client_sent_epoch_ms;
    if (client_sent_epoch_ms)
    {
        t.gap_ms = server_received_epoch_ms - *client_sent_epoch_ms;
        t.clock_skew_detected = *t.gap_ms < 0;
    }
    return t;
}

ResolveFn system_resolve_fn(const ResolverOptions& opt)
{
    return [opt](const Target& t, std::chrono::steady_clock::time_point deadline)
    {
        return resolve_target(t, opt, deadline);
    };
}

ConnectFn tcp_connect_fn()
{
    return [](const ResolvedAddress& a, uint16_t port, std::chrono::milliseconds timeout)
    {
        return tcp_connect_once(a, port, timeout);
    };
}

LookupService::LookupService(ServerOptions opt, ResolveFn resolve, ConnectFn connect)
    : opt_(std::move(opt)), resolve_(std::move(resolve)), connect_(std::move(connect))
{
}

LookupResponse LookupService::lookup(const LookupRequest& req,
                                     const std::string& source_ip,
                                     const std::atomic<bool>* cancel) const
{
    const int64_t received = epoch_ms_now();
    const auto started = std::chrono::steady_clock::now();

    LookupResponse resp{};
    resp.context.request_source_ip = source_ip;
    resp.context.client_hostname = req.client_hostname;
    if (req.client_sent_epoch_ms)
    {
        resp.timing = compute_timing(received, req.client_sent_epoch_ms);
    }

    Target target;
    try
    {
        target = validate_target(req.target);
    }
    catch (const InvalidTargetError& e)
    {
        spdlog::debug("lookup rejected target='{}': {}", req.target, e.what());
        resp.result = invalid_target_result(req.target, e.what());
        return resp;
    }

    ProbePlan plan{};
    plan.attempts = req.attempts.value_or(opt_.attempts);
    plan.per_attempt_timeout = std::chrono::milliseconds(opt_.timeout_ms);
    plan.port = req.port.value_or(opt_.probe_port);
    plan.deadline = started + std::chrono::milliseconds(opt_.deadline_ms);

    ProbeSequence seq(target, plan, resolve_, connect_, cancel);
    auto attempts = run_probes(seq, [&](const ProbeAttempt& a)
    {
        spdlog::debug("probe {} #{} {} {:.3f} ms {}", target.host, a.index,
                      outcome_str(a.outcome), a.ms, a.error);
    });

    resp.result = aggregate(target, attempts);
    for (const auto& addr : seq.resolved()) resp.result.resolved_ips.push_back(addr.ip);
    resp.result.probe_ip = seq.probe_address().ip;
    resp.result.probe_port = plan.port;
    if (!seq.resolve_error().empty()) resp.result.error = seq.resolve_error();
    return resp;
}

} // namespace ipt
