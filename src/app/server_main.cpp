#include <cstdio>
#include <exception>
#include <memory>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "ipt/cli.hpp"
#include "ipt/client.hpp"
#include "ipt/errors.hpp"
#include "ipt/http_server.hpp"
#include "ipt/logging.hpp"
#include "ipt/service.hpp"

int main(int argc, char **argv)
{
    ipt::ServerOptions opt;
    switch (ipt::parse_server_args(argc, argv, opt))
    {
        case ipt::ParseStatus::Ok: break;
        case ipt::ParseStatus::Help: return 0;
        case ipt::ParseStatus::Error: return ipt::exit_code::usage;
    }
    if (opt.log_file.empty()) opt.log_file = ipt::default_server_log_file();

    try
    {
        ipt::init_server_logging(opt);
    }
    catch (const ipt::ConfigError &e)
    {
        fmt::print(stderr, "{}\n", e.what());
        return ipt::exit_code::usage;
    }

    try
    {
        auto service = std::make_shared<const ipt::LookupService>(
            opt, ipt::system_resolve_fn(opt.resolver), ipt::tcp_connect_fn());
        ipt::HttpServer server(opt, service);
        spdlog::info("server_start host={} port={} attempts={} timeout_ms={} probe_port={} "
                     "deadline_ms={} workers={} dns={} log_file={}",
                     opt.host, server.port(), opt.attempts, opt.timeout_ms, opt.probe_port,
                     opt.deadline_ms, opt.workers,
                     fmt::join(opt.resolver.nameservers, ","), opt.log_file);
        server.run(/*handle_signals=*/true);
        spdlog::info("server_stop");
    }
    catch (const std::exception &e)
    {
        spdlog::critical("server failed: {}", e.what());
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
