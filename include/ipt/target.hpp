#pragma once

#include <string>
#include <string_view>

#include "ipt/model.hpp"

namespace ipt {

// Trim, reduce URL-ish input to its host, then accept an IPv4/IPv6 literal
// or a syntactically valid hostname. Throws InvalidTargetError otherwise.
// No DNS is performed here.
Target validate_target(std::string_view raw);

// Host part of "scheme://user@host:port/path" style input. Returns the
// input unchanged when there is nothing to strip. Throws
// InvalidTargetError when the text before "://" is not a valid scheme.
std::string extract_host(std::string_view trimmed);

// Leading/trailing whitespace removed.
std::string trim(std::string_view s);

bool is_ipv4_literal(std::string_view s);
bool is_ipv6_literal(std::string_view s);
bool is_valid_hostname(std::string_view s);

// false for private, loopback, link-local, multicast, unspecified,
// documentation, CGNAT and other reserved ranges.
bool is_public_address(std::string_view ip);

const char *target_kind_str(TargetKind kind);

} // namespace ipt
