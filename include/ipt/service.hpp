#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "ipt/model.hpp"
#include "ipt/options.hpp"
#include "ipt/runner.hpp"
#include "ipt/wire.hpp"

namespace ipt {

// Transport-independent core of POST /lookup: validate, probe, aggregate,
// attach timing and request context. Stateless; safe to call concurrently.
class LookupService {
public:
    LookupService(ServerOptions opt, ResolveFn resolve, ConnectFn connect);

    // Never throws for bad targets: InvalidTargetError becomes an
    // invalid_target result and the probe engine is not invoked.
    LookupResponse lookup(const LookupRequest& req,
                          const std::string& source_ip,
                          const std::atomic<bool>* cancel = nullptr) const;

    const ServerOptions& options() const { return opt_; }

private:
    ServerOptions opt_;
    ResolveFn resolve_;
    ConnectFn connect_;
};

// Production wiring: resolve_target() with the given resolver options and
// tcp_connect_once().
ResolveFn system_resolve_fn(const ResolverOptions& opt);
ConnectFn tcp_connect_fn();

int64_t epoch_ms_now();

RequestTiming compute_timing(int64_t server_received_epoch_ms,
                             std::optional<int64_t> client_sent_epoch_ms);

} // namespace ipt
