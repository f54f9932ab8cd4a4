#include "ipt/client.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>

#include <limits.h>
#include <unistd.h>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "ipt/errors.hpp"
#include "ipt/target.hpp"

namespace ipt
{
static std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static uint16_t parse_port(std::string_view text, std::string_view url)
{
    if (text.empty() || text.size() > 5 ||
        !std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c); }))
    {
        throw ConfigError("invalid port in server URL '" + std::string(url) + "'");
    }
    const int p = std::stoi(std::string(text));
    if (p < 1 || p > 65535)
    {
        throw ConfigError("port out of range in server URL '" + std::string(url) + "'");
    }
    return static_cast<uint16_t>(p);
}

EnvLookup process_env()
{
    return [](const std::string &name) -> std::optional<std::string>
    {
        const char *v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

ServerEndpoint parse_server_url(std::string_view raw)
{
    const std::string url = trim(raw);
    if (url.empty()) throw ConfigError("empty server URL");

    ServerEndpoint ep{};
    std::string_view rest = url;
    if (auto pos = rest.find("://"); pos != std::string_view::npos)
    {
        const std::string scheme = lower(std::string(rest.substr(0, pos)));
        if (scheme == "https")
        {
            throw ConfigError("https is not supported: '" + url + "'");
        }
        if (scheme != "http")
        {
            throw ConfigError("unsupported scheme '" + scheme + "' in '" + url + "'");
        }
        rest.remove_prefix(pos + 3);
    }

    std::string_view authority = rest;
    if (auto slash = rest.find('/'); slash != std::string_view::npos)
    {
        authority = rest.substr(0, slash);
        std::string path(rest.substr(slash));
        if (auto q = path.find_first_of("?#"); q != std::string::npos) path.erase(q);
        while (!path.empty() && path.back() == '/') path.pop_back();
        ep.base_path = path;
    }
    if (authority.find('@') != std::string_view::npos)
    {
        throw ConfigError("credentials are not supported in '" + url + "'");
    }

    std::string host;
    if (!authority.empty() && authority.front() == '[')
    {
        auto close = authority.find(']');
        if (close == std::string_view::npos)
        {
            throw ConfigError("unterminated IPv6 literal in '" + url + "'");
        }
        host = std::string(authority.substr(1, close - 1));
        std::string_view tail = authority.substr(close + 1);
        if (!tail.empty())
        {
            if (tail.front() != ':') throw ConfigError("invalid server URL '" + url + "'");
            ep.port = parse_port(tail.substr(1), url);
        }
        if (!is_ipv6_literal(host))
        {
            throw ConfigError("invalid IPv6 literal in '" + url + "'");
        }
    }
    else
    {
        const auto colons = std::count(authority.begin(), authority.end(), ':');
        if (colons > 1)
        {
            throw ConfigError("IPv6 server address must be bracketed: '" + url + "'");
        }
        if (colons == 1)
        {
            auto c = authority.find(':');
            host = std::string(authority.substr(0, c));
            ep.port = parse_port(authority.substr(c + 1), url);
        }
        else
        {
            host = std::string(authority);
        }
        host = lower(host);
        if (host.empty() || !(is_ipv4_literal(host) || is_valid_hostname(host)))
        {
            throw ConfigError("invalid host in server URL '" + url + "'");
        }
    }
    ep.host = host;
    return ep;
}

std::optional<ClientConfig> load_client_config(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
    {
        if (access(path.c_str(), F_OK) != 0) return std::nullopt;
        throw ConfigError("cannot read " + path);
    }
    Json::Value root;
    Json::CharReaderBuilder reader_builder;
    std::string errs;
    if (!Json::parseFromStream(reader_builder, in, &root, &errs))
    {
        throw ConfigError(path + " is not valid JSON: " + errs);
    }
    if (!root.isObject()) throw ConfigError(path + " must contain a JSON object");

    ClientConfig cfg{};
    if (root.isMember("server_url") && !root["server_url"].isNull())
    {
        if (!root["server_url"].isString())
        {
            throw ConfigError(path + ": server_url must be a string");
        }
        cfg.server_url = trim(root["server_url"].asString());
    }
    return cfg;
}

std::string executable_dir(const char *argv0)
{
    char buf[PATH_MAX]{};
    ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    std::string exe = n > 0 ? std::string(buf, static_cast<size_t>(n))
                            : std::string(argv0 ? argv0 : "");
    auto slash = exe.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return exe.substr(0, slash);
}

std::string client_config_path(const ClientOptions &opt,
                               const EnvLookup &env,
                               const std::string &exe_dir)
{
    if (!opt.config_path.empty()) return opt.config_path;
    if (auto v = env("IPTEST_CONFIG"); v && !trim(*v).empty()) return trim(*v);
    return exe_dir + "/" + kConfigFileName;
}

std::chrono::seconds resolve_timeout(const EnvLookup &env)
{
    int secs = kDefaultTimeoutSeconds;
    if (auto v = env("IPTEST_TIMEOUT_SECONDS"); v && !trim(*v).empty())
    {
        const std::string text = trim(*v);
        errno = 0;
        char *end = nullptr;
        long parsed = std::strtol(text.c_str(), &end, 10);
        if (errno != 0 || end == text.c_str() || *end != '\0' || parsed <= 0 || parsed > INT_MAX)
        {
            spdlog::warn("ignoring IPTEST_TIMEOUT_SECONDS='{}': not a positive integer", text);
        }
        else
        {
            secs = static_cast<int>(parsed);
        }
    }
    return std::chrono::seconds(std::max(secs, kMinTimeoutSeconds));
}

ServerEndpoint resolve_endpoint(const EnvLookup &env, const std::string &config_path)
{
    const auto timeout = resolve_timeout(env);

    if (auto v = env("IPTEST_SERVER_URL"); v && !trim(*v).empty())
    {
        try
        {
            ServerEndpoint ep = parse_server_url(*v);
            ep.source = EndpointSource::Environment;
            ep.timeout = timeout;
            spdlog::debug("server endpoint {} from IPTEST_SERVER_URL", ep.url());
            return ep;
        }
        catch (const ConfigError &e)
        {
            spdlog::warn("IPTEST_SERVER_URL ignored: {}", e.what());
        }
    }

    if (!config_path.empty())
    {
        try
        {
            auto cfg = load_client_config(config_path);
            if (cfg && !cfg->server_url.empty())
            {
                ServerEndpoint ep = parse_server_url(cfg->server_url);
                ep.source = EndpointSource::ConfigFile;
                ep.timeout = timeout;
                spdlog::debug("server endpoint {} from {}", ep.url(), config_path);
                return ep;
            }
        }
        catch (const ConfigError &e)
        {
            spdlog::warn("config file {} ignored: {}", config_path, e.what());
        }
    }

    ServerEndpoint ep = parse_server_url(kDefaultServerUrl);
    ep.source = EndpointSource::Default;
    ep.timeout = timeout;
    spdlog::debug("server endpoint {} (default)", ep.url());
    return ep;
}
} // namespace ipt
