#include "ipt/output.hpp"

#include <iomanip>
#include <sstream>

#include "ipt/model.hpp"
#include "ipt/probe.hpp"

namespace ipt {

std::string format_verdict_text(const ProbeResult& r)
{
    std::ostringstream os;
    switch (r.status)
    {
        case OverallStatus::Reachable:
            os << "target " << r.target << " is reachable\n";
            break;
        case OverallStatus::Unreachable:
            os << "target " << r.target << " is unreachable ("
               << r.success_count << '/' << r.attempt_count
               << " attempts succeeded)\n";
            break;
        case OverallStatus::InvalidTarget:
            os << "target " << r.target
               << " is not a valid IP address or hostname";
            if (!r.error.empty()) os << ": " << r.error;
            os << '\n';
            break;
    }
    return os.str();
}

std::string format_attempt_text(const ProbeAttempt& a)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "  #" << a.index << "  " << outcome_str(a.outcome);
    if (a.outcome == ProbeOutcome::Success)
    {
        os << "  " << a.ms << " ms";
    }
    else
    {
        os << "  after " << a.ms << " ms";
        if (!a.error.empty()) os << "  (" << a.error << ')';
    }
    os << '\n';
    return os.str();
}

std::string format_summary_text(const ProbeResult& r)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "Target: " << r.target;
    if (!r.target_type.empty()) os << "  (" << r.target_type << ')';
    os << '\n';
    os << "Status: " << status_str(r.status) << '\n';
    if (r.status == OverallStatus::InvalidTarget) return os.str();

    os << "Attempts: " << r.success_count << '/' << r.attempt_count
       << " succeeded, " << r.loss_count << " lost\n";
    if (r.latency)
    {
        os << "Latency: min=" << r.latency->min << " ms"
           << ", avg=" << r.latency->avg << " ms"
           << ", max=" << r.latency->max << " ms\n";
    }
    else
    {
        os << "Latency: n/a\n";
    }
    if (!r.probe_ip.empty())
    {
        os << "Probe: " << r.probe_ip << " port " << r.probe_port << '\n';
    }
    if (!r.resolved_ips.empty())
    {
        os << "Resolved:";
        for (const auto& ip : r.resolved_ips) os << ' ' << ip;
        os << '\n';
    }
    if (!r.error.empty()) os << "Error: " << r.error << '\n';
    return os.str();
}

std::string format_timing_text(const RequestTiming& t)
{
    std::ostringstream os;
    if (!t.gap_ms) return os.str();
    os << "Client -> server gap: " << *t.gap_ms << " ms";
    if (t.clock_skew_detected) os << "  (clock skew detected)";
    os << '\n';
    return os.str();
}

std::string format_lookup_text(const LookupResponse& resp)
{
    std::ostringstream os;
    os << format_verdict_text(resp.result);
    os << format_summary_text(resp.result);
    if (!resp.result.attempts.empty())
    {
        os << "Probes:\n";
        for (const auto& a : resp.result.attempts) os << format_attempt_text(a);
    }
    if (resp.timing) os << format_timing_text(*resp.timing);
    return os.str();
}

} // namespace ipt
