#pragma once

#include <cstdint>
#include <memory>

#include "ipt/options.hpp"
#include "ipt/service.hpp"

namespace ipt
{
// HTTP/1.1 front end for LookupService.
//   GET  /health -> {"status":"ok"}
//   POST /lookup -> lookup JSON (400 on a malformed body)
// Connection I/O runs on one Asio event loop; lookups run on a WorkerPool
// of opt.workers threads.
class HttpServer
{
public:
    // Binds and listens immediately; throws boost::system::system_error when
    // the address is unavailable. Port 0 picks an ephemeral port.
    HttpServer(const ServerOptions &opt, std::shared_ptr<const LookupService> service);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    uint16_t port() const;

    // Serve until stop() (or SIGINT/SIGTERM when handle_signals).
    void run(bool handle_signals = false);

    // Thread-safe.
    void stop();

private:
    struct Impl;
    Impl *impl_;
};
} // namespace ipt
