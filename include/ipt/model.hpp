#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ipt {

enum class TargetKind { Ip, Domain };

// Validated probe target. Only validate_target() builds one.
struct Target {
    std::string input;      // trimmed user input
    std::string host;       // canonical IP literal or lower-cased hostname
    TargetKind  kind{TargetKind::Domain};
    int         af{};       // AF_INET / AF_INET6 for IP targets, 0 for domains
};

struct ResolvedAddress {
    int         af{};
    std::string ip;
};

enum class ProbeOutcome { Success, Timeout, Refused, Error };

struct ProbeAttempt {
    int                                   index{};   // 1-based
    ProbeOutcome                          outcome{ProbeOutcome::Error};
    double                                ms{};      // elapsed, never negative
    std::chrono::system_clock::time_point timestamp{};
    std::string                           address;   // probed IP (empty if never resolved)
    std::string                           error;     // empty on success
};

struct LatencyStats {
    double min{};
    double avg{};
    double max{};
};

enum class OverallStatus { Reachable, Unreachable, InvalidTarget };

struct ProbeResult {
    std::string                 target;        // as supplied
    std::string                 target_type;   // "ip" | "domain" | "" when invalid
    OverallStatus               status{OverallStatus::Unreachable};
    std::vector<ProbeAttempt>   attempts;
    int                         attempt_count{};   // == attempts.size() on the server
    int                         success_count{};
    int                         loss_count{};
    std::optional<LatencyStats> latency;       // absent when success_count == 0
    std::vector<std::string>    resolved_ips;
    std::string                 probe_ip;
    uint16_t                    probe_port{};
    std::string                 error;         // validation / resolution detail
};

struct RequestTiming {
    int64_t                server_received_epoch_ms{};
    std::optional<int64_t> client_sent_epoch_ms;
    std::optional<int64_t> gap_ms;
    bool                   clock_skew_detected{};
};

struct RequestContext {
    std::string request_source_ip;
    std::string client_hostname;
    // Raw X-Forwarded-For header; empty when the request carried none.
    std::string x_forwarded_for;
};

struct LookupResponse {
    ProbeResult                  result;
    std::optional<RequestTiming> timing;
    RequestContext               context;
};

} // namespace ipt
