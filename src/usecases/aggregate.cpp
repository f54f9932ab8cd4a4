#include "ipt/aggregate.hpp"

#include <algorithm>
#include <numeric>
#include <string>

#include "ipt/target.hpp"

namespace ipt {

std::optional<LatencyStats> aggregate_times(const std::vector<double>& times)
{
    if (times.empty()) return std::nullopt;

    LatencyStats st{};
    auto [min_it, max_it] = std::minmax_element(times.begin(), times.end());
    st.min = *min_it;
    st.max = *max_it;
    st.avg = std::accumulate(times.begin(), times.end(), 0.0) /
             static_cast<double>(times.size());
    return st;
}

ProbeResult aggregate(const Target& target, const std::vector<ProbeAttempt>& attempts)
{
    ProbeResult r{};
    r.target = target.input;
    r.target_type = target_kind_str(target.kind);
    r.attempts = attempts;

    std::vector<double> ok_times;
    ok_times.reserve(attempts.size());
    for (const auto& a : attempts)
    {
        switch (a.outcome)
        {
            case ProbeOutcome::Success:
                ok_times.push_back(a.ms);
                break;
            case ProbeOutcome::Timeout:
            case ProbeOutcome::Refused:
            case ProbeOutcome::Error:
                break;
        }
    }

    r.attempt_count = static_cast<int>(attempts.size());
    r.success_count = static_cast<int>(ok_times.size());
    r.loss_count = r.attempt_count - r.success_count;
    r.latency = aggregate_times(ok_times);
    r.status = r.success_count > 0 ? OverallStatus::Reachable
                                   : OverallStatus::Unreachable;
    return r;
}

ProbeResult invalid_target_result(const std::string& raw, const std::string& reason)
{
    ProbeResult r{};
    r.target = raw;
    r.status = OverallStatus::InvalidTarget;
    r.error = reason;
    return r;
}

} // namespace ipt
