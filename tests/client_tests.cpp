#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include "ipt/cli.hpp"
#include "ipt/client.hpp"
#include "ipt/errors.hpp"
#include "ipt/model.hpp"
#include "ipt/output.hpp"
#include "ipt/wire.hpp"

using namespace ipt;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_contains(const std::string& haystack, std::string_view needle, std::string_view msg)
{
    if (haystack.find(needle) == std::string::npos)
    {
        std::cerr << "ASSERT FAILED: missing substring: " << needle << " | " << msg << std::endl;
        std::cerr << "Actual: " << haystack << std::endl;
        std::exit(1);
    }
}

static EnvLookup fake_env(std::map<std::string, std::string> vars)
{
    return [vars](const std::string& name) -> std::optional<std::string>
    {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

static bool url_rejected(std::string_view url)
{
    try
    {
        (void)parse_server_url(url);
    }
    catch (const ConfigError&)
    {
        return true;
    }
    return false;
}

// Scratch directory under /tmp, one per test run.
static std::string scratch_dir()
{
    static std::string dir;
    if (dir.empty())
    {
        char tmpl[] = "/tmp/iptest_client_XXXXXX";
        const char* made = mkdtemp(tmpl);
        assert_true(made != nullptr, "mkdtemp");
        dir = made;
    }
    return dir;
}

static std::string write_file(const std::string& name, const std::string& content)
{
    const std::string path = scratch_dir() + "/" + name;
    std::ofstream out(path);
    out << content;
    return path;
}

struct FakeTransport : LookupTransport
{
    HttpReply reply{200, ""};
    bool unreachable = false;
    std::string last_path;
    std::string last_body;
    int calls = 0;

    HttpReply post_json(const std::string& path, const std::string& body) override
    {
        ++calls;
        last_path = path;
        last_body = body;
        if (unreachable) throw ServiceUnreachableError("connect failed: Connection refused");
        return reply;
    }

    HttpReply get(const std::string& path) override
    {
        ++calls;
        last_path = path;
        if (unreachable) throw ServiceUnreachableError("connect failed: Connection refused");
        return reply;
    }
};

struct Captured
{
    int code = -1;
    std::string out;
    std::string err;
};

static Captured run(const ClientOptions& opt, FakeTransport& t)
{
    ServerEndpoint ep = parse_server_url("http://testserver:9999");
    std::ostringstream out;
    std::ostringstream err;
    Captured c;
    c.code = run_client(opt, ep, t, out, err);
    c.out = out.str();
    c.err = err.str();
    return c;
}

static std::string response_body(OverallStatus status, int success, int attempts)
{
    LookupResponse resp{};
    resp.result.target = "8.8.8.8";
    resp.result.target_type = "ip";
    resp.result.status = status;
    resp.result.success_count = success;
    resp.result.attempt_count = attempts;
    resp.result.loss_count = attempts - success;
    if (success > 0) resp.result.latency = LatencyStats{5.0, 6.0, 7.0};
    return build_lookup_json(resp);
}

// argv with stable storage for the parsers.
struct Args
{
    std::vector<std::string> store;
    std::vector<char*> ptrs;

    Args(std::initializer_list<const char*> items)
    {
        for (const char* s : items) store.emplace_back(s);
        for (auto& s : store) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(store.size()); }
    char** argv() { return ptrs.data(); }
};

static void test_parse_server_url()
{
    ServerEndpoint a = parse_server_url("http://host:9999");
    assert_true(a.host == "host" && a.port == 9999 && a.base_path.empty(), "http://host:9999");
    assert_true(a.url() == "http://host:9999", "url() round trip");

    ServerEndpoint b = parse_server_url("10.0.0.5:8080");
    assert_true(b.host == "10.0.0.5" && b.port == 8080, "host:port without scheme");

    ServerEndpoint c = parse_server_url("Probe.Example.ORG");
    assert_true(c.host == "probe.example.org" && c.port == 8000, "bare host keeps default port");

    ServerEndpoint d = parse_server_url("http://[2001:db8::5]:8001/");
    assert_true(d.host == "2001:db8::5" && d.port == 8001, "bracketed v6");
    assert_true(d.url() == "http://[2001:db8::5]:8001", "v6 url bracketed again");

    ServerEndpoint e = parse_server_url("http://gw.example:80/iptest/?x=1");
    assert_true(e.base_path == "/iptest", "base path trimmed");

    assert_true(url_rejected(""), "empty");
    assert_true(url_rejected("https://host:9999"), "https rejected");
    assert_true(url_rejected("ftp://host"), "other scheme rejected");
    assert_true(url_rejected("http://user@host"), "credentials rejected");
    assert_true(url_rejected("2001:db8::5"), "unbracketed v6 rejected");
    assert_true(url_rejected("http://host:0"), "port 0");
    assert_true(url_rejected("http://host:99999"), "port too large");
    assert_true(url_rejected("http://host:abc"), "port not numeric");
    assert_true(url_rejected("http://bad_host!/"), "invalid host");
}

static void test_endpoint_from_environment()
{
    EnvLookup env = fake_env({{"IPTEST_SERVER_URL", "http://host:9999"}});
    ServerEndpoint ep = resolve_endpoint(env, scratch_dir() + "/missing.json");
    assert_true(ep.host == "host" && ep.port == 9999, "env endpoint used");
    assert_true(ep.source == EndpointSource::Environment, "source environment");
    assert_true(std::string(endpoint_source_str(ep.source)) == "environment", "source string");
}

static void test_endpoint_env_beats_config()
{
    const std::string cfg = write_file("both.json", R"({"server_url":"http://cfg.example:7000"})");
    EnvLookup env = fake_env({{"IPTEST_SERVER_URL", "http://env.example:7001"}});
    ServerEndpoint ep = resolve_endpoint(env, cfg);
    assert_true(ep.host == "env.example" && ep.port == 7001, "environment wins");
}

static void test_endpoint_from_config_file()
{
    const std::string cfg = write_file("good.json", R"({"server_url": "http://cfg.example:7000/base"})");
    ServerEndpoint ep = resolve_endpoint(fake_env({}), cfg);
    assert_true(ep.host == "cfg.example" && ep.port == 7000, "config endpoint");
    assert_true(ep.base_path == "/base", "config base path");
    assert_true(ep.source == EndpointSource::ConfigFile, "source config_file");

    // Blank environment value counts as unset.
    ServerEndpoint blank = resolve_endpoint(fake_env({{"IPTEST_SERVER_URL", "  "}}), cfg);
    assert_true(blank.source == EndpointSource::ConfigFile, "blank env ignored");
}

static void test_endpoint_fallbacks()
{
    ServerEndpoint none = resolve_endpoint(fake_env({}), scratch_dir() + "/missing.json");
    assert_true(none.source == EndpointSource::Default, "no sources -> default");
    assert_true(none.url() == kDefaultServerUrl, "default url");

    const std::string broken = write_file("broken.json", "{ server_url: ");
    ServerEndpoint b = resolve_endpoint(fake_env({}), broken);
    assert_true(b.source == EndpointSource::Default, "malformed file -> default");

    const std::string wrong_type = write_file("wrong.json", R"({"server_url": 8000})");
    ServerEndpoint w = resolve_endpoint(fake_env({}), wrong_type);
    assert_true(w.source == EndpointSource::Default, "non-string server_url -> default");

    const std::string no_key = write_file("nokey.json", R"({"other": 1})");
    ServerEndpoint n = resolve_endpoint(fake_env({}), no_key);
    assert_true(n.source == EndpointSource::Default, "missing key -> default");

    const std::string cfg = write_file("fallback.json", R"({"server_url":"http://cfg.example:7000"})");
    ServerEndpoint bad_env = resolve_endpoint(fake_env({{"IPTEST_SERVER_URL", "https://x"}}), cfg);
    assert_true(bad_env.source == EndpointSource::ConfigFile, "bad env value falls to config");
}

static void test_load_client_config()
{
    assert_true(!load_client_config(scratch_dir() + "/missing.json").has_value(), "missing -> nullopt");

    const std::string path = write_file("cfg.json", R"({"server_url":" http://a.example:1 "})");
    auto cfg = load_client_config(path);
    assert_true(cfg && cfg->server_url == "http://a.example:1", "value trimmed");

    const std::string arr = write_file("arr.json", "[1]");
    bool threw = false;
    try
    {
        (void)load_client_config(arr);
    }
    catch (const ConfigError&)
    {
        threw = true;
    }
    assert_true(threw, "non-object root rejected");
}

static void test_timeout()
{
    assert_true(resolve_timeout(fake_env({})).count() == 35, "default 35 s");
    assert_true(resolve_timeout(fake_env({{"IPTEST_TIMEOUT_SECONDS", "60"}})).count() == 60, "override");
    assert_true(resolve_timeout(fake_env({{"IPTEST_TIMEOUT_SECONDS", "5"}})).count() == 15, "floor 15 s");
    assert_true(resolve_timeout(fake_env({{"IPTEST_TIMEOUT_SECONDS", "soon"}})).count() == 35,
                "garbage ignored");
    assert_true(resolve_timeout(fake_env({{"IPTEST_TIMEOUT_SECONDS", "-4"}})).count() == 35,
                "negative ignored");

    ServerEndpoint ep = resolve_endpoint(fake_env({{"IPTEST_TIMEOUT_SECONDS", "20"}}), "");
    assert_true(ep.timeout.count() == 20, "endpoint carries timeout");
}

static void test_client_config_path()
{
    ClientOptions opt{};
    assert_true(client_config_path(opt, fake_env({}), "/opt/iptest") == "/opt/iptest/client_config.json",
                "beside executable");
    assert_true(client_config_path(opt, fake_env({{"IPTEST_CONFIG", "/etc/ipt.json"}}), "/opt/iptest") ==
                    "/etc/ipt.json",
                "env path");
    opt.config_path = "/home/u/c.json";
    assert_true(client_config_path(opt, fake_env({{"IPTEST_CONFIG", "/etc/ipt.json"}}), "/opt/iptest") ==
                    "/home/u/c.json",
                "--config wins");
}

static void test_run_unreachable_service()
{
    FakeTransport t;
    t.unreachable = true;
    Captured c = run(ClientOptions{}, t);
    assert_true(c.code == exit_code::service_unreachable, "exit 3");
    assert_contains(c.err, "could not reach test server at http://testserver:9999", "names the server");
    assert_true(c.out.empty(), "nothing on stdout");
}

static void test_run_bad_responses()
{
    FakeTransport t;
    t.reply = HttpReply{500, R"({"error":"internal server error"})"};
    Captured c = run(ClientOptions{}, t);
    assert_true(c.code == exit_code::bad_response, "HTTP 500 -> 4");
    assert_contains(c.err, "HTTP 500", "status reported");
    assert_contains(c.err, "internal server error", "server message reported");

    t.reply = HttpReply{200, "<html>hello</html>"};
    c = run(ClientOptions{}, t);
    assert_true(c.code == exit_code::bad_response, "non-JSON -> 4");
    assert_contains(c.err, "invalid response", "message");

    t.reply = HttpReply{200, R"({"target":"x","status":"reachable","success_count":9,"attempts":3})"};
    c = run(ClientOptions{}, t);
    assert_true(c.code == exit_code::bad_response, "inconsistent counts -> 4");
}

static void test_run_statuses()
{
    FakeTransport t;
    t.reply = HttpReply{200, response_body(OverallStatus::Reachable, 3, 3)};
    Captured ok = run(ClientOptions{}, t);
    assert_true(ok.code == exit_code::reachable, "reachable -> 0");
    assert_contains(ok.out, "target 8.8.8.8 is reachable", "verdict printed");
    assert_true(t.last_path == "/lookup", "posted to /lookup");
    assert_contains(t.last_body, R"("target":"8.8.8.8")", "default target sent");
    assert_contains(t.last_body, R"("client_sent_epoch_ms":)", "send time sent");

    t.reply = HttpReply{200, response_body(OverallStatus::Unreachable, 0, 3)};
    Captured down = run(ClientOptions{}, t);
    assert_true(down.code == exit_code::unreachable, "unreachable -> 1");

    t.reply = HttpReply{200, response_body(OverallStatus::InvalidTarget, 0, 0)};
    ClientOptions bad{};
    bad.target = "!!!bad_host!!!";
    Captured inv = run(bad, t);
    assert_true(inv.code == exit_code::invalid_target, "invalid_target -> 2");
    assert_contains(t.last_body, R"("target":"!!!bad_host!!!")", "target forwarded unvalidated");
}

static void test_run_json_output()
{
    FakeTransport t;
    const std::string body = response_body(OverallStatus::Reachable, 2, 3);
    t.reply = HttpReply{200, body};
    ClientOptions opt{};
    opt.json = true;
    opt.target = "example.com";
    Captured c = run(opt, t);
    assert_true(c.code == exit_code::reachable, "exit by status");
    assert_true(c.out == body + "\n", "body printed verbatim");
}

static void test_run_health()
{
    FakeTransport t;
    t.reply = HttpReply{200, R"({"status":"ok"})"};
    ClientOptions opt{};
    opt.health = true;
    Captured c = run(opt, t);
    assert_true(c.code == 0, "healthy -> 0");
    assert_true(t.last_path == "/health", "GET /health");
    assert_contains(c.out, "is healthy", "healthy message");

    t.reply = HttpReply{503, R"({"error":"down"})"};
    Captured d = run(opt, t);
    assert_true(d.code == exit_code::bad_response, "unhealthy -> 4");
}

static void test_parse_client_args()
{
    {
        Args a{"iptest", "--json", "example.com"};
        ClientOptions opt{};
        assert_true(parse_client_args(a.argc(), a.argv(), opt) == ParseStatus::Ok, "ok");
        assert_true(opt.json && opt.target == "example.com", "json + target");
    }
    {
        Args a{"iptest", "--config=/tmp/c.json", "-v", "--health"};
        ClientOptions opt{};
        assert_true(parse_client_args(a.argc(), a.argv(), opt) == ParseStatus::Ok, "ok");
        assert_true(opt.config_path == "/tmp/c.json" && opt.verbose && opt.health, "flags");
        assert_true(opt.target.empty(), "no target");
    }
    {
        Args a{"iptest", "a.example", "b.example"};
        ClientOptions opt{};
        assert_true(parse_client_args(a.argc(), a.argv(), opt) == ParseStatus::Error, "two targets");
    }
    {
        Args a{"iptest", "--bogus"};
        ClientOptions opt{};
        assert_true(parse_client_args(a.argc(), a.argv(), opt) == ParseStatus::Error, "unknown option");
    }
    {
        Args a{"iptest", "--config"};
        ClientOptions opt{};
        assert_true(parse_client_args(a.argc(), a.argv(), opt) == ParseStatus::Error, "missing value");
    }
}

static void test_parse_server_args()
{
    {
        Args a{"iptest-server", "--port", "0", "--attempts=5", "--probe-port", "53",
               "--dns", "9.9.9.9, 1.0.0.1", "--workers", "2"};
        ServerOptions opt{};
        assert_true(parse_server_args(a.argc(), a.argv(), opt) == ParseStatus::Ok, "ok");
        assert_true(opt.port == 0 && opt.attempts == 5 && opt.probe_port == 53, "values");
        assert_true(opt.resolver.nameservers == std::vector<std::string>({"9.9.9.9", "1.0.0.1"}),
                    "dns list");
        assert_true(opt.workers == 2, "workers");
    }
    {
        Args a{"iptest-server", "--attempts", "11"};
        ServerOptions opt{};
        assert_true(parse_server_args(a.argc(), a.argv(), opt) == ParseStatus::Error, "attempts > max");
    }
    {
        Args a{"iptest-server", "--port", "eighty"};
        ServerOptions opt{};
        assert_true(parse_server_args(a.argc(), a.argv(), opt) == ParseStatus::Error, "non-numeric port");
    }
    {
        Args a{"iptest-server", "--timeout-ms", "5000", "--deadline-ms", "1000"};
        ServerOptions opt{};
        assert_true(parse_server_args(a.argc(), a.argv(), opt) == ParseStatus::Error,
                    "deadline shorter than timeout");
    }
    {
        Args a{"iptest-server", "--port-range", "1"};
        ServerOptions opt{};
        assert_true(parse_server_args(a.argc(), a.argv(), opt) == ParseStatus::Error,
                    "prefix of a known flag is not that flag");
    }
}

int main()
{
    test_parse_server_url();
    test_endpoint_from_environment();
    test_endpoint_env_beats_config();
    test_endpoint_from_config_file();
    test_endpoint_fallbacks();
    test_load_client_config();
    test_timeout();
    test_client_config_path();
    test_run_unreachable_service();
    test_run_bad_responses();
    test_run_statuses();
    test_run_json_output();
    test_run_health();
    test_parse_client_args();
    test_parse_server_args();

    std::cout << "client tests: OK" << std::endl;
    return 0;
}
