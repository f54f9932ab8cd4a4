#pragma once

#include <string>
#include <vector>

#include "ipt/model.hpp"

namespace ipt {

enum class RawDnsErrorKind {
    None = 0,
    InitFailed,
    InvalidQname,
    QueryFailed,
};

struct RawDnsResult {
    double ms{};
    int rc{};                 // 0 on success, -1 on error
    std::string error;        // error message when rc != 0
    RawDnsErrorKind kind{RawDnsErrorKind::None};
    std::vector<ResolvedAddress> addresses;  // A then AAAA answers
};

// Query A and AAAA for `host` straight at `nameservers` with ldns,
// bypassing the system resolver configuration.
RawDnsResult resolve_rawdns_once(const std::string& host,
                                 const std::vector<std::string>& nameservers,
                                 int timeout_ms);

} // namespace ipt
