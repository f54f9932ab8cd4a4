#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ipt/model.hpp"

namespace ipt {

// Decoded POST /lookup body.
struct LookupRequest {
    std::string             target;
    std::optional<uint16_t> port;
    std::optional<int>      attempts;
    std::optional<int64_t>  client_sent_epoch_ms;
    std::string             client_hostname;
};

// Throws ProtocolError: not JSON, not an object, target missing or not a
// string, port outside 1..65535, attempts outside 1..max_attempts.
LookupRequest parse_lookup_request(const std::string& body, int max_attempts);

// Query string of GET /lookup (without the '?'): target, port and attempts,
// percent- and '+'-decoded, checked like the JSON body. Throws ProtocolError
// when target is missing or empty or a value is out of range.
LookupRequest parse_lookup_query(const std::string& query, int max_attempts);

// First entry of an X-Forwarded-For value, trimmed; empty when there is none.
std::string first_forwarded_for(const std::string& header);

// Client side. Throws ProtocolError on anything that is not a well-formed
// lookup response (unknown status, success_count outside 0..attempts, ...).
LookupResponse parse_lookup_response(const std::string& body);

// true when the body is {"status":"ok"}. Throws ProtocolError when not JSON.
bool parse_health_response(const std::string& body);

// "error" member of an error body, or the raw body when there is none.
std::string parse_error_message(const std::string& body);

std::optional<ProbeOutcome> parse_outcome(const std::string& s);
std::optional<OverallStatus> parse_status(const std::string& s);

} // namespace ipt
