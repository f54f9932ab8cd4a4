#pragma once

#include <chrono>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "ipt/http_client.hpp"
#include "ipt/options.hpp"

namespace ipt
{
namespace exit_code
{
constexpr int reachable = 0;
constexpr int unreachable = 1;
constexpr int invalid_target = 2;
constexpr int service_unreachable = 3;
constexpr int bad_response = 4;
constexpr int usage = 64;
} // namespace exit_code

constexpr const char *kDefaultTarget = "8.8.8.8";
constexpr const char *kDefaultServerUrl = "http://127.0.0.1:8000";
constexpr const char *kConfigFileName = "client_config.json";
constexpr int kDefaultTimeoutSeconds = 35;
constexpr int kMinTimeoutSeconds = 15;

// Environment accessor; std::nullopt when unset. Injected so tests never
// touch the process environment.
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

EnvLookup process_env();

struct ClientConfig
{
    std::string server_url;     // empty = not set
};

// http://host[:port][/base], host:port, host, [v6]:port.
// Throws ConfigError on anything else (https included).
ServerEndpoint parse_server_url(std::string_view url);

// std::nullopt when the file does not exist. Throws ConfigError when it
// exists but is unreadable, not JSON, not an object, or server_url is not
// a string.
std::optional<ClientConfig> load_client_config(const std::string &path);

// --config, else IPTEST_CONFIG, else client_config.json beside the executable.
std::string client_config_path(const ClientOptions &opt,
                               const EnvLookup &env,
                               const std::string &exe_dir);

// Directory holding the running executable ("." when unknown).
std::string executable_dir(const char *argv0);

// IPTEST_TIMEOUT_SECONDS (default 35), never below 15.
std::chrono::seconds resolve_timeout(const EnvLookup &env);

// IPTEST_SERVER_URL, then the config file, then the default. A malformed
// tier is logged and skipped.
ServerEndpoint resolve_endpoint(const EnvLookup &env, const std::string &config_path);

// One request against `endpoint`, rendered to out/err. Returns the exit code.
int run_client(const ClientOptions &opt,
               const ServerEndpoint &endpoint,
               LookupTransport &transport,
               std::ostream &out,
               std::ostream &err);
} // namespace ipt
