#include "ipt/http_server.hpp"

#include <chrono>
#include <csignal>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <spdlog/spdlog.h>

#include "ipt/concurrency.hpp"
#include "ipt/errors.hpp"
#include "ipt/output.hpp"
#include "ipt/wire.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace ipt
{
namespace
{
// One client connection. Reads a request, answers it, and keeps reading
// while the client asks for keep-alive.
class Session : public std::enable_shared_from_this<Session>
{
public:
    Session(tcp::socket socket,
            const ServerOptions &opt,
            std::shared_ptr<const LookupService> service,
            WorkerPool &pool)
        : stream_(std::move(socket)),
          opt_(opt),
          service_(std::move(service)),
          pool_(pool)
    {
        beast::error_code ec;
        auto ep = stream_.socket().remote_endpoint(ec);
        if (!ec) peer_ip_ = ep.address().to_string();
        source_ip_ = peer_ip_;
    }

    void run()
    {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    void do_read()
    {
        req_ = {};
        stream_.expires_after(std::chrono::milliseconds(opt_.io_timeout_ms));
        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t)
    {
        if (ec == http::error::end_of_stream)
        {
            do_close();
            return;
        }
        if (ec)
        {
            spdlog::debug("read from {} failed: {}", peer_ip_, ec.message());
            return;
        }
        handle_request();
    }

    void handle_request()
    {
        started_ = std::chrono::steady_clock::now();
        std::string path(req_.target());
        std::string query;
        if (auto q = path.find('?'); q != std::string::npos)
        {
            query = path.substr(q + 1);
            path.erase(q);
        }

        // The first X-Forwarded-For hop names the client behind a proxy.
        forwarded_for_ = std::string(req_["X-Forwarded-For"]);
        source_ip_ = first_forwarded_for(forwarded_for_);
        if (source_ip_.empty()) source_ip_ = peer_ip_;

        if (path == "/health")
        {
            if (req_.method() != http::verb::get)
            {
                respond(http::status::method_not_allowed, build_error_json("method not allowed"),
                        "health", "", "error", "GET");
                return;
            }
            respond(http::status::ok, build_health_json(), "health", "", "ok");
            return;
        }
        if (path != "/lookup")
        {
            respond(http::status::not_found, build_error_json("not found"),
                    "unknown", "", "error");
            return;
        }
        if (req_.method() != http::verb::post && req_.method() != http::verb::get)
        {
            respond(http::status::method_not_allowed, build_error_json("method not allowed"),
                    "lookup", "", "error", "GET, POST");
            return;
        }

        LookupRequest parsed;
        try
        {
            parsed = req_.method() == http::verb::get
                         ? parse_lookup_query(query, opt_.max_attempts)
                         : parse_lookup_request(req_.body(), opt_.max_attempts);
        }
        catch (const ProtocolError &e)
        {
            respond(http::status::bad_request, build_error_json(e.what()),
                    "lookup", "", "bad_request");
            return;
        }

        // No I/O pending while the lookup runs on the pool.
        stream_.expires_never();
        auto self = shared_from_this();
        const bool queued = pool_.submit(
            [self, req = std::move(parsed)](const std::atomic<bool> &cancel)
            {
                self->run_lookup(req, cancel);
            });
        if (!queued)
        {
            respond(http::status::internal_server_error,
                    build_error_json("server is shutting down"), "lookup", "", "error");
        }
    }

    // Worker thread.
    void run_lookup(const LookupRequest &req, const std::atomic<bool> &cancel)
    {
        http::status code = http::status::ok;
        std::string body;
        std::string status;
        try
        {
            LookupResponse resp = service_->lookup(req, source_ip_, &cancel);
            resp.context.x_forwarded_for = forwarded_for_;
            body = build_lookup_json(resp);
            status = status_str(resp.result.status);
        }
        catch (const std::exception &e)
        {
            spdlog::error("lookup target='{}' failed: {}", req.target, e.what());
            code = http::status::internal_server_error;
            body = build_error_json("internal server error");
            status = "error";
        }
        net::post(stream_.get_executor(),
                  [self = shared_from_this(), code, body = std::move(body),
                   target = req.target, status = std::move(status)]() mutable
                  {
                      self->respond(code, std::move(body), "lookup", target, status);
                  });
    }

    void respond(http::status code,
                 std::string body,
                 const char *action,
                 const std::string &target,
                 const std::string &status,
                 const char *allow = nullptr)
    {
        auto res = std::make_shared<http::response<http::string_body>>(code, req_.version());
        res->set(http::field::server, "iptest-server");
        res->set(http::field::content_type, "application/json");
        if (allow) res->set(http::field::allow, allow);
        res->keep_alive(req_.keep_alive());
        res->body() = std::move(body);
        res->prepare_payload();

        const double ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started_).count();
        spdlog::info("request source_ip={} action={} target='{}' status={} http={} duration_ms={:.3f}",
                     source_ip_, action, target, status, static_cast<int>(code), ms);

        stream_.expires_after(std::chrono::milliseconds(opt_.io_timeout_ms));
        http::async_write(stream_, *res,
                          [self = shared_from_this(), res](beast::error_code ec, std::size_t)
                          {
                              self->on_write(res->need_eof(), ec);
                          });
    }

    void on_write(bool close, beast::error_code ec)
    {
        if (ec)
        {
            spdlog::debug("write to {} failed: {}", peer_ip_, ec.message());
            return;
        }
        if (close)
        {
            do_close();
            return;
        }
        do_read();
    }

    void do_close()
    {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    const ServerOptions &opt_;
    std::shared_ptr<const LookupService> service_;
    WorkerPool &pool_;
    std::string peer_ip_;
    std::string source_ip_;
    std::string forwarded_for_;
    std::chrono::steady_clock::time_point started_{};
};
} // namespace

struct HttpServer::Impl
{
    // Destroyed bottom-up: the pool joins its workers before the event loop goes.
    ServerOptions opt;
    std::shared_ptr<const LookupService> service;
    net::io_context ioc{1};
    tcp::acceptor acceptor{ioc};
    WorkerPool pool;

    Impl(const ServerOptions &o, std::shared_ptr<const LookupService> s)
        : opt(o), service(std::move(s)), pool(o.workers, "probe")
    {
        tcp::endpoint ep(net::ip::make_address(opt.host), opt.port);
        acceptor.open(ep.protocol());
        acceptor.set_option(net::socket_base::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen(net::socket_base::max_listen_connections);
    }

    void do_accept()
    {
        acceptor.async_accept(
            [this](beast::error_code ec, tcp::socket socket)
            {
                if (ec == net::error::operation_aborted || !acceptor.is_open()) return;
                if (ec)
                {
                    spdlog::warn("accept failed: {}", ec.message());
                }
                else
                {
                    std::make_shared<Session>(std::move(socket), opt, service, pool)->run();
                }
                do_accept();
            });
    }
};

HttpServer::HttpServer(const ServerOptions &opt, std::shared_ptr<const LookupService> service)
    : impl_(new Impl(opt, std::move(service)))
{
}

HttpServer::~HttpServer()
{
    impl_->pool.shutdown();
    delete impl_;
}

uint16_t HttpServer::port() const
{
    return impl_->acceptor.local_endpoint().port();
}

void HttpServer::run(bool handle_signals)
{
    std::optional<net::signal_set> signals;
    if (handle_signals)
    {
        signals.emplace(impl_->ioc, SIGINT, SIGTERM);
        signals->async_wait([this](beast::error_code ec, int sig)
        {
            if (ec) return;
            spdlog::info("signal {} received, stopping", sig);
            stop();
        });
    }
    impl_->do_accept();
    impl_->ioc.run();
}

void HttpServer::stop()
{
    net::post(impl_->ioc, [impl = impl_]
    {
        beast::error_code ec;
        impl->acceptor.close(ec);
        impl->ioc.stop();
    });
}
} // namespace ipt
