#include "ipt/client.hpp"

#include <ostream>

#include <unistd.h>

#include <fmt/ostream.h>
#include <spdlog/spdlog.h>

#include "ipt/errors.hpp"
#include "ipt/output.hpp"
#include "ipt/service.hpp"
#include "ipt/wire.hpp"

namespace ipt
{
static std::string local_hostname()
{
    char buf[256]{};
    if (gethostname(buf, sizeof(buf) - 1) != 0) return {};
    return buf;
}

static int exit_code_for(OverallStatus s)
{
    switch (s)
    {
        case OverallStatus::Reachable: return exit_code::reachable;
        case OverallStatus::Unreachable: return exit_code::unreachable;
        case OverallStatus::InvalidTarget: return exit_code::invalid_target;
    }
    return exit_code::bad_response;
}

static int run_health(const ServerEndpoint &endpoint,
                      LookupTransport &transport,
                      std::ostream &out,
                      std::ostream &err)
{
    HttpReply reply = transport.get("/health");
    if (reply.status != 200 || !parse_health_response(reply.body))
    {
        fmt::print(err, "test server returned an invalid response (HTTP {}): {}\n",
                   reply.status, parse_error_message(reply.body));
        return exit_code::bad_response;
    }
    fmt::print(out, "test server at {} is healthy ({})\n",
               endpoint.url(), endpoint_source_str(endpoint.source));
    return exit_code::reachable;
}

static int run_lookup(const ClientOptions &opt,
                      LookupTransport &transport,
                      std::ostream &out,
                      std::ostream &err)
{
    const std::string target = opt.target.empty() ? kDefaultTarget : opt.target;
    const std::string body = build_lookup_request_json(target, epoch_ms_now(), local_hostname());

    HttpReply reply = transport.post_json("/lookup", body);
    if (reply.status != 200)
    {
        fmt::print(err, "test server returned an invalid response (HTTP {}): {}\n",
                   reply.status, parse_error_message(reply.body));
        return exit_code::bad_response;
    }

    LookupResponse resp = parse_lookup_response(reply.body);
    if (opt.json)
    {
        fmt::print(out, "{}\n", reply.body);
    }
    else
    {
        fmt::print(out, "{}", format_lookup_text(resp));
    }
    return exit_code_for(resp.result.status);
}

int run_client(const ClientOptions &opt,
               const ServerEndpoint &endpoint,
               LookupTransport &transport,
               std::ostream &out,
               std::ostream &err)
{
    spdlog::debug("using test server {} ({}), timeout {} s", endpoint.url(),
                  endpoint_source_str(endpoint.source), endpoint.timeout.count());
    try
    {
        if (opt.health) return run_health(endpoint, transport, out, err);
        return run_lookup(opt, transport, out, err);
    }
    catch (const ServiceUnreachableError &e)
    {
        fmt::print(err, "could not reach test server at {}: {}\n", endpoint.url(), e.what());
        return exit_code::service_unreachable;
    }
    catch (const ProtocolError &e)
    {
        fmt::print(err, "test server returned an invalid response: {}\n", e.what());
        return exit_code::bad_response;
    }
}
} // namespace ipt
