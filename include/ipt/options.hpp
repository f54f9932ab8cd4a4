#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ipt
{
struct ResolverOptions
{
    int timeout_ms = 3000;                  // bound for each resolution step
    std::vector<std::string> nameservers{"8.8.8.8", "1.1.1.1"}; // raw DNS fallback
};

struct ServerOptions
{
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    int attempts = 3;           // default attempts per lookup
    int max_attempts = 10;      // upper bound accepted from a request
    int timeout_ms = 1000;      // per-attempt connect timeout
    uint16_t probe_port = 443;  // TCP port probed on the target
    int deadline_ms = 10000;    // whole-request probing budget
    int io_timeout_ms = 15000;  // HTTP read/write timeout per message
    int workers = 8;            // probe worker threads
    ResolverOptions resolver;
    std::string log_file;       // empty = no file sink
    std::string log_level = "info";
};

struct ClientOptions
{
    std::string target;         // empty = default target
    bool json = false;          // print the server's JSON verbatim
    bool health = false;        // GET /health instead of a lookup
    bool verbose = false;       // debug logging on stderr
    std::string config_path;    // explicit client_config.json
};
} // namespace ipt
