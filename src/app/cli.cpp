#include "ipt/cli.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

using namespace std::string_view_literals;

namespace ipt {

void print_server_usage(const char *prog)
{
    fmt::print("Reachability test server\n");
    fmt::print("Usage: {} [options]\n", prog);
    fmt::print("Options:\n");
    fmt::print("  --host ADDR            Listen address (default: 0.0.0.0)\n");
    fmt::print("  --port N               Listen port (default: 8000)\n");
    fmt::print("  --attempts N           Probes per lookup (default: 3, max: 10)\n");
    fmt::print("  --timeout-ms MS        Per-probe connect timeout (default: 1000)\n");
    fmt::print("  --probe-port N         TCP port probed on the target (default: 443)\n");
    fmt::print("  --deadline-ms MS       Probing budget per request (default: 10000)\n");
    fmt::print("  --resolve-timeout-ms MS\n"
               "                         Name resolution timeout (default: 3000)\n");
    fmt::print("  --workers N            Probe worker threads (default: 8)\n");
    fmt::print("  --dns LIST             Fallback nameservers (default: 8.8.8.8,1.1.1.1)\n");
    fmt::print("  --log-file PATH        Log file (default: $IP_TEST_LOG_FILE or iptest-server.log)\n");
    fmt::print("  --log-level L          trace|debug|info|warn|error|critical (default: info)\n");
    fmt::print("  -h, --help             Show this help\n");
}

void print_client_usage(const char *prog)
{
    fmt::print("Network reachability test client\n");
    fmt::print("Usage: {} [options] [target]\n", prog);
    fmt::print("Options:\n");
    fmt::print("  --json             Print the server's JSON response\n");
    fmt::print("  --health           Check the test server instead of a target\n");
    fmt::print("  --config PATH      client_config.json to use\n");
    fmt::print("  -v, --verbose      Debug logging on stderr\n");
    fmt::print("  -h, --help         Show this help\n");
    fmt::print("\n");
    fmt::print("Environment:\n");
    fmt::print("  IPTEST_SERVER_URL       Test server URL (overrides the config file)\n");
    fmt::print("  IPTEST_CONFIG           Path of client_config.json\n");
    fmt::print("  IPTEST_TIMEOUT_SECONDS  Request timeout (default: 35, min: 15)\n");
    fmt::print("\n");
    fmt::print("Examples:\n");
    fmt::print("  {}                 (probes 8.8.8.8)\n", prog);
    fmt::print("  {} example.com\n", prog);
    fmt::print("  IPTEST_SERVER_URL=http://10.0.0.5:8000 {} --json 1.1.1.1\n", prog);
}

// "--name V" or "--name=V". matched says whether `a` is this flag; false
// return means the flag had no value.
static bool take_value(std::string_view a, std::string_view name,
                       int argc, char **argv, int &i, std::string &val, bool &matched)
{
    matched = false;
    if (a.rfind(name, 0) != 0) return true;
    std::string_view rest = a.substr(name.size());
    if (rest.empty())
    {
        matched = true;
        if (i + 1 >= argc)
        {
            fmt::print(stderr, "missing value for {}\n", name);
            return false;
        }
        val = argv[++i];
        return true;
    }
    if (rest.front() != '=') return true;   // a longer flag sharing the prefix
    matched = true;
    val = std::string(rest.substr(1));
    return true;
}

static bool to_int(std::string_view name, const std::string &val, int lo, int hi, int &out)
{
    try
    {
        size_t used = 0;
        int v = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
        if (v < lo || v > hi)
        {
            fmt::print(stderr, "{} out of range ({}..{}): {}\n", name, lo, hi, v);
            return false;
        }
        out = v;
        return true;
    }
    catch (const std::logic_error &)
    {
        fmt::print(stderr, "invalid {}: {}\n", name, val);
        return false;
    }
}

static std::vector<std::string> split_list(const std::string &val)
{
    std::vector<std::string> out;
    std::string cur;
    for (char ch : val)
    {
        if (ch == ',')
        {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        }
        else if (ch != ' ')
        {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

ParseStatus parse_server_args(int argc, char **argv, ServerOptions &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "-h"sv || a == "--help"sv)
        {
            print_server_usage(argv[0]);
            return ParseStatus::Help;
        }

        std::string val;
        bool matched = false;
        int n = 0;

        if (!take_value(a, "--host", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            if (val.empty())
            {
                fmt::print(stderr, "invalid --host usage\n");
                return ParseStatus::Error;
            }
            opt.host = val;
            continue;
        }
        if (!take_value(a, "--port", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            if (!to_int("--port", val, 0, 65535, n)) return ParseStatus::Error;
            opt.port = static_cast<uint16_t>(n);
            continue;
        }
        if (!take_value(a, "--attempts", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            if (!to_int("--attempts", val, 1, opt.max_attempts, opt.attempts)) return ParseStatus::Error;
            continue;
        }
        if (!take_value(a, "--timeout-ms", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            if (!to_int("--timeout-ms", val, 1, 60000, opt.timeout_ms)) return ParseStatus::Error;
            continue;
        }
        if (!take_value(a, "--probe-port", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            if (!to_int("--probe-port", val, 1, 65535, n)) return ParseStatus::Error;
            opt.probe_port = static_cast<uint16_t>(n);
            continue;
        }
        if (!take_value(a, "--deadline-ms", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            if (!to_int("--deadline-ms", val, 1, 600000, opt.deadline_ms)) return ParseStatus::Error;
            continue;
        }
        if (!take_value(a, "--resolve-timeout-ms", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            if (!to_int("--resolve-timeout-ms", val, 1, 60000, opt.resolver.timeout_ms))
            {
                return ParseStatus::Error;
            }
            continue;
        }
        if (!take_value(a, "--workers", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            if (!to_int("--workers", val, 1, 256, opt.workers)) return ParseStatus::Error;
            continue;
        }
        if (!take_value(a, "--dns", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            auto list = split_list(val);
            if (list.empty())
            {
                fmt::print(stderr, "invalid --dns usage\n");
                return ParseStatus::Error;
            }
            opt.resolver.nameservers = std::move(list);
            continue;
        }
        if (!take_value(a, "--log-file", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            opt.log_file = val;
            continue;
        }
        if (!take_value(a, "--log-level", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            opt.log_level = val;
            continue;
        }

        fmt::print(stderr, "unknown option: {}\n", a);
        return ParseStatus::Error;
    }
    if (opt.deadline_ms < opt.timeout_ms)
    {
        fmt::print(stderr, "--deadline-ms ({}) must be at least --timeout-ms ({})\n",
                   opt.deadline_ms, opt.timeout_ms);
        return ParseStatus::Error;
    }
    return ParseStatus::Ok;
}

ParseStatus parse_client_args(int argc, char **argv, ClientOptions &opt)
{
    bool have_target = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "-h"sv || a == "--help"sv)
        {
            print_client_usage(argv[0]);
            return ParseStatus::Help;
        }
        if (a == "--json"sv)
        {
            opt.json = true;
            continue;
        }
        if (a == "--health"sv)
        {
            opt.health = true;
            continue;
        }
        if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.verbose = true;
            continue;
        }

        std::string val;
        bool matched = false;
        if (!take_value(a, "--config", argc, argv, i, val, matched)) return ParseStatus::Error;
        if (matched)
        {
            if (val.empty())
            {
                fmt::print(stderr, "invalid --config usage\n");
                return ParseStatus::Error;
            }
            opt.config_path = val;
            continue;
        }

        if (a.size() > 1 && a.front() == '-')
        {
            fmt::print(stderr, "unknown option: {}\n", a);
            return ParseStatus::Error;
        }
        if (have_target)
        {
            fmt::print(stderr, "only one target may be given (got '{}' and '{}')\n",
                       opt.target, a);
            return ParseStatus::Error;
        }
        opt.target = std::string(a);
        have_target = true;
    }
    return ParseStatus::Ok;
}

} // namespace ipt
