#include "ipt/http_client.hpp"

#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <spdlog/spdlog.h>

#include "ipt/errors.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace ipt
{
static std::string host_header(const ServerEndpoint &ep)
{
    std::string h = ep.host.find(':') != std::string::npos ? "[" + ep.host + "]" : ep.host;
    return h + ":" + std::to_string(ep.port);
}

std::string ServerEndpoint::url() const
{
    return scheme + "://" + host_header(*this) + base_path;
}

const char *endpoint_source_str(EndpointSource s)
{
    switch (s)
    {
        case EndpointSource::Environment: return "environment";
        case EndpointSource::ConfigFile: return "config_file";
        case EndpointSource::Default: return "default";
    }
    return "default";
}

BeastTransport::BeastTransport(ServerEndpoint endpoint)
    : endpoint_(std::move(endpoint))
{
}

HttpReply BeastTransport::post_json(const std::string &path, const std::string &body)
{
    return exchange(true, path, body);
}

HttpReply BeastTransport::get(const std::string &path)
{
    return exchange(false, path, {});
}

HttpReply BeastTransport::exchange(bool post, const std::string &path, const std::string &body)
{
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::flat_buffer buffer;

    http::request<http::string_body> req{post ? http::verb::post : http::verb::get,
                                         endpoint_.base_path + path, 11};
    req.set(http::field::host, host_header(endpoint_));
    req.set(http::field::user_agent, "iptest/" BOOST_BEAST_VERSION_STRING);
    req.set(http::field::accept, "application/json");
    if (post)
    {
        req.set(http::field::content_type, "application/json");
        req.body() = body;
    }
    req.keep_alive(false);
    req.prepare_payload();

    http::response<http::string_body> res;
    beast::error_code failure;
    const char *stage = "resolve";
    bool finished = false;

    const auto deadline = std::chrono::steady_clock::now() + endpoint_.timeout;

    resolver.async_resolve(
        endpoint_.host, std::to_string(endpoint_.port),
        [&](beast::error_code ec, tcp::resolver::results_type results)
        {
            if (ec)
            {
                failure = ec;
                return;
            }
            stage = "connect";
            stream.expires_at(deadline);
            stream.async_connect(
                results,
                [&](beast::error_code ec2, const tcp::endpoint &)
                {
                    if (ec2)
                    {
                        failure = ec2;
                        return;
                    }
                    stage = "send";
                    http::async_write(
                        stream, req,
                        [&](beast::error_code ec3, std::size_t)
                        {
                            if (ec3)
                            {
                                failure = ec3;
                                return;
                            }
                            stage = "receive";
                            http::async_read(
                                stream, buffer, res,
                                [&](beast::error_code ec4, std::size_t)
                                {
                                    if (ec4)
                                    {
                                        failure = ec4;
                                        return;
                                    }
                                    finished = true;
                                });
                        });
                });
        });

    // The stream expiry bounds connect/write/read; run_for also bounds the
    // resolver, which has no timeout of its own.
    ioc.run_for(endpoint_.timeout + std::chrono::seconds(1));

    const std::string where = endpoint_.url();
    if (!finished && !failure)
    {
        throw ServiceUnreachableError("timed out after " +
                                      std::to_string(endpoint_.timeout.count()) +
                                      " s during " + stage + " (" + where + ")");
    }
    if (failure)
    {
        spdlog::debug("http {} failed: {}", stage, failure.message());
        if (failure == http::error::end_of_stream || failure == net::error::eof ||
            failure == net::error::connection_reset)
        {
            throw ServiceUnreachableError("server closed the connection before replying (" +
                                          where + ")");
        }
        if (failure.category() == http::make_error_code(http::error::end_of_stream).category())
        {
            throw ProtocolError(std::string("malformed HTTP reply: ") + failure.message());
        }
        if (failure == beast::error::timeout)
        {
            throw ServiceUnreachableError("timed out after " +
                                          std::to_string(endpoint_.timeout.count()) +
                                          " s during " + stage + " (" + where + ")");
        }
        throw ServiceUnreachableError(std::string(stage) + " failed: " +
                                      failure.message() + " (" + where + ")");
    }

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    spdlog::debug("http {} {} -> {}", post ? "POST" : "GET", path, res.result_int());
    return HttpReply{static_cast<int>(res.result_int()), std::move(res.body())};
}
} // namespace ipt
