#include "ipt/output.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "ipt/json.hpp"
#include "ipt/model.hpp"
#include "ipt/probe.hpp"

namespace ipt
{
const char *status_str(OverallStatus s)
{
    switch (s)
    {
        case OverallStatus::Reachable: return "reachable";
        case OverallStatus::Unreachable: return "unreachable";
        case OverallStatus::InvalidTarget: return "invalid_target";
    }
    return "unreachable";
}

std::string format_utc_iso(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int frac = static_cast<int>(ms % 1000);
    if (frac < 0)
    {
        frac += 1000;
        --secs;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << frac << 'Z';
    return os.str();
}

static void write_attempt(std::ostringstream &os, const ProbeAttempt &a)
{
    os << "{";
    os << R"("attempt":)" << a.index
       << R"(,"outcome":)" << json_quote(outcome_str(a.outcome))
       << R"(,"ms":)" << a.ms
       << R"(,"timestamp":)" << json_quote(format_utc_iso(a.timestamp));
    if (!a.address.empty()) os << R"(,"address":)" << json_quote(a.address);
    if (!a.error.empty()) os << R"(,"error":)" << json_quote(a.error);
    os << "}";
}

std::string build_lookup_json(const LookupResponse &resp)
{
    const ProbeResult &r = resp.result;
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("target":)" << json_quote(r.target) << ",";
    os << R"("status":)" << json_quote(status_str(r.status)) << ",";
    os << R"("success_count":)" << r.success_count << ",";
    os << R"("attempts":)" << r.attempt_count << ",";
    os << R"("loss_count":)" << r.loss_count << ",";
    if (r.latency)
    {
        os << R"("latency_ms":{"min":)" << r.latency->min
           << R"(,"avg":)" << r.latency->avg
           << R"(,"max":)" << r.latency->max << "},";
    }
    else
    {
        os << R"("latency_ms":null,)";
    }
    os << R"("target_type":)" << json_quote(r.target_type) << ",";
    os << R"("resolved_ips":[)";
    for (size_t i = 0; i < r.resolved_ips.size(); ++i)
    {
        if (i) os << ",";
        os << json_quote(r.resolved_ips[i]);
    }
    os << "],";
    os << R"("probe_ip":)" << json_quote(r.probe_ip) << ",";
    os << R"("probe_port":)" << r.probe_port << ",";
    os << R"("probes":[)";
    for (size_t i = 0; i < r.attempts.size(); ++i)
    {
        if (i) os << ",";
        write_attempt(os, r.attempts[i]);
    }
    os << "]";
    if (!r.error.empty()) os << R"(,"error":)" << json_quote(r.error);
    if (resp.timing)
    {
        const RequestTiming &t = *resp.timing;
        os << R"(,"timing":{"server_received_epoch_ms":)"
           << t.server_received_epoch_ms;
        if (t.client_sent_epoch_ms)
        {
            os << R"(,"client_sent_epoch_ms":)" << *t.client_sent_epoch_ms;
        }
        if (t.gap_ms) os << R"(,"gap_ms":)" << *t.gap_ms;
        os << R"(,"clock_skew_detected":)"
           << (t.clock_skew_detected ? "true" : "false") << "}";
    }
    os << R"(,"request_context":{"request_source_ip":)"
       << json_quote(resp.context.request_source_ip)
       << R"(,"client_hostname":)" << json_quote(resp.context.client_hostname)
       << R"(,"x_forwarded_for":)"
       << (resp.context.x_forwarded_for.empty() ? std::string("null")
                                                : json_quote(resp.context.x_forwarded_for))
       << "}";
    os << "}";
    return os.str();
}

std::string build_health_json()
{
    return R"({"status":"ok"})";
}

std::string build_error_json(const std::string &message)
{
    std::ostringstream os;
    os << R"({"error":)" << json_quote(message) << "}";
    return os.str();
}

std::string build_lookup_request_json(const std::string &target,
                                      int64_t client_sent_epoch_ms,
                                      const std::string &client_hostname)
{
    std::ostringstream os;
    os << "{";
    os << R"("target":)" << json_quote(target);
    os << R"(,"client_context":{"client_sent_epoch_ms":)" << client_sent_epoch_ms;
    if (!client_hostname.empty())
    {
        os << R"(,"client_hostname":)" << json_quote(client_hostname);
    }
    os << "}}";
    return os.str();
}
} // namespace ipt
