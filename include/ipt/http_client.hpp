#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace ipt
{
enum class EndpointSource { Environment, ConfigFile, Default };

struct ServerEndpoint
{
    std::string scheme = "http";
    std::string host = "127.0.0.1";     // IPv6 literals without brackets
    uint16_t port = 8000;
    std::string base_path;              // "" or "/prefix" without trailing slash
    EndpointSource source = EndpointSource::Default;
    std::chrono::seconds timeout{35};

    // http://host:port/base
    std::string url() const;
};

const char *endpoint_source_str(EndpointSource s);

struct HttpReply
{
    int status{};
    std::string body;
};

// One request/response exchange with the test server.
// Implementations throw ServiceUnreachableError when the server cannot be
// reached in time and ProtocolError when its reply is not valid HTTP.
class LookupTransport
{
public:
    virtual ~LookupTransport() = default;

    virtual HttpReply post_json(const std::string &path, const std::string &body) = 0;
    virtual HttpReply get(const std::string &path) = 0;
};

// HTTP/1.1 over Boost.Beast. Each call opens a fresh connection bounded by
// the endpoint timeout (resolve + connect + write + read).
class BeastTransport : public LookupTransport
{
public:
    explicit BeastTransport(ServerEndpoint endpoint);

    HttpReply post_json(const std::string &path, const std::string &body) override;
    HttpReply get(const std::string &path) override;

private:
    HttpReply exchange(bool post, const std::string &path, const std::string &body);

    ServerEndpoint endpoint_;
};
} // namespace ipt
