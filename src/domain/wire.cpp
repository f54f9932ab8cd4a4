#include "ipt/wire.hpp"

#include <charconv>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string_view>

#include <json/json.h>

#include "ipt/errors.hpp"
#include "ipt/target.hpp"

namespace ipt {

// Strict parse: no comments, no trailing data, object or array root.
static bool parse_json(const std::string& body, Json::Value& root, std::string& errs)
{
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    return reader->parse(body.data(), body.data() + body.size(), &root, &errs);
}

static Json::Value parse_object(const std::string& body, const char* what)
{
    Json::Value j;
    std::string errs;
    if (!parse_json(body, j, errs))
    {
        throw ProtocolError(std::string(what) + " is not valid JSON: " + errs);
    }
    if (!j.isObject()) throw ProtocolError(std::string(what) + " is not a JSON object");
    return j;
}

static bool present(const Json::Value& j, const char* key)
{
    return j.isMember(key) && !j[key].isNull();
}

static int64_t int_member(const Json::Value& j, const char* key)
{
    if (!j.isMember(key) || !j[key].isIntegral())
    {
        throw ProtocolError(std::string("field '") + key + "' missing or not an integer");
    }
    return j[key].asInt64();
}

static std::string string_member(const Json::Value& j, const char* key, bool required)
{
    if (!present(j, key))
    {
        if (required) throw ProtocolError(std::string("field '") + key + "' is required");
        return {};
    }
    if (!j[key].isString())
    {
        throw ProtocolError(std::string("field '") + key + "' must be a string");
    }
    return j[key].asString();
}

static double number_member(const Json::Value& j, const char* key)
{
    if (!j.isMember(key) || !j[key].isNumeric())
    {
        throw ProtocolError(std::string("field '") + key + "' missing or not a number");
    }
    return j[key].asDouble();
}

std::optional<ProbeOutcome> parse_outcome(const std::string& s)
{
    if (s == "success") return ProbeOutcome::Success;
    if (s == "timeout") return ProbeOutcome::Timeout;
    if (s == "refused") return ProbeOutcome::Refused;
    if (s == "error") return ProbeOutcome::Error;
    return std::nullopt;
}

std::optional<OverallStatus> parse_status(const std::string& s)
{
    if (s == "reachable") return OverallStatus::Reachable;
    if (s == "unreachable") return OverallStatus::Unreachable;
    if (s == "invalid_target") return OverallStatus::InvalidTarget;
    return std::nullopt;
}

static uint16_t checked_port(int64_t p)
{
    if (p < 1 || p > 65535) throw ProtocolError("field 'port' must be in 1..65535");
    return static_cast<uint16_t>(p);
}

static int checked_attempts(int64_t n, int max_attempts)
{
    if (n < 1 || n > max_attempts)
    {
        throw ProtocolError("field 'attempts' must be in 1.." + std::to_string(max_attempts));
    }
    return static_cast<int>(n);
}

LookupRequest parse_lookup_request(const std::string& body, int max_attempts)
{
    const Json::Value j = parse_object(body, "request body");
    LookupRequest req{};
    req.target = string_member(j, "target", true);

    if (present(j, "port"))
    {
        if (!j["port"].isIntegral()) throw ProtocolError("field 'port' must be an integer");
        req.port = checked_port(j["port"].asInt64());
    }
    if (present(j, "attempts"))
    {
        if (!j["attempts"].isIntegral()) throw ProtocolError("field 'attempts' must be an integer");
        req.attempts = checked_attempts(j["attempts"].asInt64(), max_attempts);
    }
    if (present(j, "client_context"))
    {
        const Json::Value& ctx = j["client_context"];
        if (!ctx.isObject()) throw ProtocolError("field 'client_context' must be an object");
        if (present(ctx, "client_sent_epoch_ms"))
        {
            req.client_sent_epoch_ms = int_member(ctx, "client_sent_epoch_ms");
        }
        req.client_hostname = string_member(ctx, "client_hostname", false);
    }
    return req;
}

static int hex_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// application/x-www-form-urlencoded component.
static std::string form_decode(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '+')
        {
            out += ' ';
        }
        else if (s[i] == '%')
        {
            const int hi = i + 2 < s.size() ? hex_value(s[i + 1]) : -1;
            const int lo = hi >= 0 ? hex_value(s[i + 2]) : -1;
            if (lo < 0) throw ProtocolError("malformed percent-escape in query string");
            out += static_cast<char>(hi * 16 + lo);
            i += 2;
        }
        else
        {
            out += s[i];
        }
    }
    return out;
}

static int64_t query_int(const std::string& value, const char* key)
{
    int64_t n = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, n);
    if (ec != std::errc() || ptr != end || value.empty())
    {
        throw ProtocolError(std::string("field '") + key + "' must be an integer");
    }
    return n;
}

LookupRequest parse_lookup_query(const std::string& query, int max_attempts)
{
    std::optional<std::string> target;
    std::optional<std::string> port;
    std::optional<std::string> attempts;

    std::string_view rest(query);
    while (!rest.empty())
    {
        const std::size_t amp = rest.find('&');
        const std::string_view pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);
        if (pair.empty()) continue;

        const std::size_t eq = pair.find('=');
        const std::string key = form_decode(pair.substr(0, eq));
        const std::string value = eq == std::string_view::npos ? std::string{}
                                                               : form_decode(pair.substr(eq + 1));
        // First occurrence wins.
        if (key == "target" && !target) target = value;
        else if (key == "port" && !port) port = value;
        else if (key == "attempts" && !attempts) attempts = value;
    }

    if (!target || target->empty()) throw ProtocolError("query parameter 'target' is required");
    LookupRequest req{};
    req.target = *target;
    if (port) req.port = checked_port(query_int(*port, "port"));
    if (attempts) req.attempts = checked_attempts(query_int(*attempts, "attempts"), max_attempts);
    return req;
}

std::string first_forwarded_for(const std::string& header)
{
    return trim(std::string_view(header).substr(0, header.find(',')));
}

// Inverse of format_utc_iso(); epoch on anything unparsable.
static std::chrono::system_clock::time_point parse_utc_iso(const std::string& s)
{
    std::tm tm{};
    std::istringstream is(s);
    is >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (is.fail()) return {};
    int frac = 0;
    if (is.peek() == '.')
    {
        is.get();
        is >> frac;
        if (is.fail()) frac = 0;
    }
    const std::time_t secs = timegm(&tm);
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::milliseconds(frac);
}

static ProbeAttempt parse_attempt(const Json::Value& j)
{
    if (!j.isObject()) throw ProtocolError("probe entry is not an object");
    ProbeAttempt a{};
    a.index = static_cast<int>(int_member(j, "attempt"));
    const std::string outcome = string_member(j, "outcome", true);
    auto o = parse_outcome(outcome);
    if (!o) throw ProtocolError("unknown probe outcome: " + outcome);
    a.outcome = *o;
    a.ms = number_member(j, "ms");
    if (a.ms < 0) throw ProtocolError("negative probe time");
    a.timestamp = parse_utc_iso(string_member(j, "timestamp", false));
    a.address = string_member(j, "address", false);
    a.error = string_member(j, "error", false);
    return a;
}

LookupResponse parse_lookup_response(const std::string& body)
{
    const Json::Value j = parse_object(body, "response body");
    LookupResponse resp{};
    ProbeResult& r = resp.result;

    r.target = string_member(j, "target", true);
    const std::string status = string_member(j, "status", true);
    auto st = parse_status(status);
    if (!st) throw ProtocolError("unknown status: " + status);
    r.status = *st;

    const int64_t success = int_member(j, "success_count");
    const int64_t attempts = int_member(j, "attempts");
    if (attempts < 0 || success < 0 || success > attempts)
    {
        throw ProtocolError("inconsistent success_count/attempts");
    }
    r.success_count = static_cast<int>(success);
    r.attempt_count = static_cast<int>(attempts);
    r.loss_count = present(j, "loss_count") ? static_cast<int>(int_member(j, "loss_count"))
                                            : r.attempt_count - r.success_count;

    if (present(j, "latency_ms"))
    {
        const Json::Value& lat = j["latency_ms"];
        if (!lat.isObject()) throw ProtocolError("field 'latency_ms' must be an object or null");
        r.latency = LatencyStats{number_member(lat, "min"),
                                 number_member(lat, "avg"),
                                 number_member(lat, "max")};
    }
    if (r.success_count == 0 && r.latency)
    {
        throw ProtocolError("latency present without successful attempts");
    }

    r.target_type = string_member(j, "target_type", false);
    if (j.isMember("resolved_ips") && j["resolved_ips"].isArray())
    {
        for (const auto& ip : j["resolved_ips"])
        {
            if (ip.isString()) r.resolved_ips.push_back(ip.asString());
        }
    }
    r.probe_ip = string_member(j, "probe_ip", false);
    if (j.isMember("probe_port") && j["probe_port"].isIntegral())
    {
        r.probe_port = static_cast<uint16_t>(j["probe_port"].asUInt());
    }
    if (present(j, "probes"))
    {
        if (!j["probes"].isArray()) throw ProtocolError("field 'probes' must be an array");
        for (const auto& p : j["probes"]) r.attempts.push_back(parse_attempt(p));
    }
    r.error = string_member(j, "error", false);

    if (j.isMember("timing") && j["timing"].isObject())
    {
        const Json::Value& t = j["timing"];
        RequestTiming timing{};
        timing.server_received_epoch_ms = int_member(t, "server_received_epoch_ms");
        if (present(t, "client_sent_epoch_ms"))
        {
            timing.client_sent_epoch_ms = int_member(t, "client_sent_epoch_ms");
        }
        if (present(t, "gap_ms")) timing.gap_ms = int_member(t, "gap_ms");
        if (t.isMember("clock_skew_detected") && t["clock_skew_detected"].isBool())
        {
            timing.clock_skew_detected = t["clock_skew_detected"].asBool();
        }
        resp.timing = timing;
    }
    if (j.isMember("request_context") && j["request_context"].isObject())
    {
        const Json::Value& c = j["request_context"];
        resp.context.request_source_ip = string_member(c, "request_source_ip", false);
        resp.context.client_hostname = string_member(c, "client_hostname", false);
        resp.context.x_forwarded_for = string_member(c, "x_forwarded_for", false);
    }
    return resp;
}

bool parse_health_response(const std::string& body)
{
    const Json::Value j = parse_object(body, "health body");
    return j.isMember("status") && j["status"].isString() && j["status"].asString() == "ok";
}

std::string parse_error_message(const std::string& body)
{
    Json::Value j;
    std::string errs;
    if (parse_json(body, j, errs) && j.isObject() && j.isMember("error") && j["error"].isString())
    {
        return j["error"].asString();
    }
    return body;
}

} // namespace ipt
