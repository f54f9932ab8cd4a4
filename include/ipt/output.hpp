#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ipt
{
// Forward declarations to avoid heavy includes in header
struct ProbeAttempt;
struct ProbeResult;
struct RequestTiming;
struct LookupResponse;
enum class OverallStatus;

const char *status_str(OverallStatus s);

// 2024-05-01T12:34:56.789Z
std::string format_utc_iso(std::chrono::system_clock::time_point tp);

// JSON builders (single object string without trailing newline)
std::string build_lookup_json(const LookupResponse &resp);

std::string build_health_json();

std::string build_error_json(const std::string &message);

std::string build_lookup_request_json(const std::string &target,
                                      int64_t client_sent_epoch_ms,
                                      const std::string &client_hostname);

// Text formatting (returns complete text block with trailing newlines)
std::string format_verdict_text(const ProbeResult &r);

std::string format_attempt_text(const ProbeAttempt &a);

std::string format_summary_text(const ProbeResult &r);

std::string format_timing_text(const RequestTiming &t);

std::string format_lookup_text(const LookupResponse &resp);
} // namespace ipt
