#include "ipt/target.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "ipt/errors.hpp"

namespace ipt
{
std::string trim(std::string_view s)
{
    constexpr std::string_view ws = " \t\r\n\v\f";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return std::string(s.substr(first, last - first + 1));
}

static bool all_digits(std::string_view s)
{
    return !s.empty() && std::ranges::all_of(
               s,
               [](unsigned char c) { return std::isdigit(c) != 0; });
}

// RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
static bool is_scheme(std::string_view s)
{
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front()))) return false;
    return std::ranges::all_of(s, [](unsigned char c)
    {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

bool is_ipv4_literal(std::string_view s)
{
    in_addr a{};
    return inet_pton(AF_INET, std::string(s).c_str(), &a) == 1;
}

bool is_ipv6_literal(std::string_view s)
{
    in6_addr a{};
    return inet_pton(AF_INET6, std::string(s).c_str(), &a) == 1;
}

bool is_valid_hostname(std::string_view s)
{
    if (!s.empty() && s.back() == '.') s.remove_suffix(1);
    if (s.empty() || s.size() > 253) return false;

    std::string_view last_label;
    size_t start = 0;
    for (;;)
    {
        const size_t dot = s.find('.', start);
        std::string_view label = dot == std::string_view::npos
                                     ? s.substr(start)
                                     : s.substr(start, dot - start);
        if (label.empty() || label.size() > 63) return false;
        if (label.front() == '-' || label.back() == '-') return false;
        for (unsigned char c: label)
        {
            if (!std::isalnum(c) && c != '-') return false;
        }
        last_label = label;
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    // "999.999.999.999" is a broken IPv4 literal, not a hostname
    return !all_digits(last_label);
}

std::string extract_host(std::string_view trimmed)
{
    std::string_view s = trimmed;
    if (const auto scheme = s.find("://"); scheme != std::string_view::npos)
    {
        if (!is_scheme(s.substr(0, scheme)))
        {
            throw InvalidTargetError("invalid scheme in target: " + std::string(trimmed));
        }
        s.remove_prefix(scheme + 3);
    }
    if (const auto end = s.find_first_of("/?#"); end != std::string_view::npos)
    {
        s = s.substr(0, end);
    }
    if (const auto at = s.rfind('@'); at != std::string_view::npos)
    {
        s.remove_prefix(at + 1);
    }
    if (!s.empty() && s.front() == '[')
    {
        const auto close = s.find(']');
        if (close == std::string_view::npos) return std::string(s);
        return std::string(s.substr(1, close - 1));
    }
    if (std::ranges::count(s, ':') == 1)
    {
        const auto colon = s.find(':');
        if (all_digits(s.substr(colon + 1))) s = s.substr(0, colon);
    }
    return std::string(s);
}

Target validate_target(std::string_view raw)
{
    std::string trimmed = trim(raw);
    if (trimmed.empty()) throw InvalidTargetError("target is empty");

    std::string host = (is_ipv4_literal(trimmed) || is_ipv6_literal(trimmed))
                           ? trimmed
                           : extract_host(trimmed);
    if (host.empty())
    {
        throw InvalidTargetError("no host in target: " + trimmed);
    }

    Target t{};
    t.input = trimmed;

    char buf[INET6_ADDRSTRLEN]{};
    in_addr a4{};
    in6_addr a6{};
    if (inet_pton(AF_INET, host.c_str(), &a4) == 1)
    {
        t.kind = TargetKind::Ip;
        t.af = AF_INET;
        t.host = inet_ntop(AF_INET, &a4, buf, sizeof(buf)) ? buf : host;
        return t;
    }
    if (inet_pton(AF_INET6, host.c_str(), &a6) == 1)
    {
        t.kind = TargetKind::Ip;
        t.af = AF_INET6;
        t.host = inet_ntop(AF_INET6, &a6, buf, sizeof(buf)) ? buf : host;
        return t;
    }

    if (!is_valid_hostname(host))
    {
        throw InvalidTargetError("invalid hostname: " + trimmed);
    }
    if (host.back() == '.') host.pop_back();
    std::ranges::transform(
        host,
        host.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    t.kind = TargetKind::Domain;
    t.af = 0;
    t.host = std::move(host);
    return t;
}

static bool is_public_v4(uint32_t v)
{
    struct Block
    {
        uint32_t base;
        int      prefix;
    };
    static constexpr Block kNonPublic[] = {
        {0x00000000u, 8},  // 0.0.0.0/8
        {0x0A000000u, 8},  // 10.0.0.0/8
        {0x64400000u, 10}, // 100.64.0.0/10 (CGNAT)
        {0x7F000000u, 8},  // 127.0.0.0/8
        {0xA9FE0000u, 16}, // 169.254.0.0/16
        {0xAC100000u, 12}, // 172.16.0.0/12
        {0xC0000000u, 24}, // 192.0.0.0/24
        {0xC0000200u, 24}, // 192.0.2.0/24
        {0xC0A80000u, 16}, // 192.168.0.0/16
        {0xC6120000u, 15}, // 198.18.0.0/15
        {0xC6336400u, 24}, // 198.51.100.0/24
        {0xCB007100u, 24}, // 203.0.113.0/24
        {0xE0000000u, 4},  // 224.0.0.0/4 multicast
        {0xF0000000u, 4},  // 240.0.0.0/4 reserved + broadcast
    };
    for (const auto &[base, prefix]: kNonPublic)
    {
        const uint32_t mask = prefix == 0 ? 0u : ~0u << (32 - prefix);
        if ((v & mask) == base) return false;
    }
    return true;
}

bool is_public_address(std::string_view ip)
{
    const std::string s(ip);
    in_addr a4{};
    if (inet_pton(AF_INET, s.c_str(), &a4) == 1)
    {
        return is_public_v4(ntohl(a4.s_addr));
    }
    in6_addr a6{};
    if (inet_pton(AF_INET6, s.c_str(), &a6) != 1) return false;

    const uint8_t *b = a6.s6_addr;
    if (IN6_IS_ADDR_UNSPECIFIED(&a6) || IN6_IS_ADDR_LOOPBACK(&a6)) return false;
    if (IN6_IS_ADDR_V4MAPPED(&a6))
    {
        const uint32_t v = (uint32_t{b[12]} << 24) | (uint32_t{b[13]} << 16) |
                           (uint32_t{b[14]} << 8) | uint32_t{b[15]};
        return is_public_v4(v);
    }
    if ((b[0] & 0xfe) == 0xfc) return false;                  // fc00::/7
    if (b[0] == 0xfe && (b[1] & 0xc0) == 0x80) return false;  // fe80::/10
    if (b[0] == 0xff) return false;                           // ff00::/8
    if (b[0] == 0x20 && b[1] == 0x01 && b[2] == 0x0d && b[3] == 0xb8)
    {
        return false;                                         // 2001:db8::/32
    }
    return true;
}

const char *target_kind_str(TargetKind kind)
{
    switch (kind)
    {
        case TargetKind::Ip: return "ip";
        case TargetKind::Domain: return "domain";
    }
    return "domain";
}
} // namespace ipt
