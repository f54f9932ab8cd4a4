#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <sys/socket.h>

#include "ipt/errors.hpp"
#include "ipt/target.hpp"

using namespace ipt;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static bool rejects(std::string_view raw)
{
    try
    {
        (void)validate_target(raw);
    }
    catch (const InvalidTargetError &)
    {
        return true;
    }
    return false;
}

static void test_ipv4_literals()
{
    Target t = validate_target("8.8.8.8");
    assert_true(t.kind == TargetKind::Ip, "8.8.8.8 is ip");
    assert_true(t.af == AF_INET, "AF_INET");
    assert_true(t.host == "8.8.8.8", "host kept");
    assert_true(t.input == "8.8.8.8", "input kept");

    Target padded = validate_target("  1.1.1.1\t\n");
    assert_true(padded.host == "1.1.1.1" && padded.input == "1.1.1.1", "whitespace trimmed");
}

static void test_ipv6_literals()
{
    Target t = validate_target("2001:4860:4860:0:0:0:0:8888");
    assert_true(t.kind == TargetKind::Ip && t.af == AF_INET6, "v6 literal");
    assert_true(t.host == "2001:4860:4860::8888", "canonical textual form");

    Target b = validate_target("[2606:4700:4700::1111]");
    assert_true(b.kind == TargetKind::Ip && b.host == "2606:4700:4700::1111", "bracketed v6");

    Target bp = validate_target("[::1]:8443");
    assert_true(bp.host == "::1", "bracketed v6 with port");
}

static void test_hostnames()
{
    Target t = validate_target("Example.COM.");
    assert_true(t.kind == TargetKind::Domain, "domain");
    assert_true(t.host == "example.com", "lower-cased, trailing dot removed");
    assert_true(t.af == 0, "no family for domains");

    assert_true(validate_target("a-b.c-d.example").host == "a-b.c-d.example", "hyphens inside labels");
    assert_true(validate_target("localhost").kind == TargetKind::Domain, "single label");

    const std::string label63(63, 'a');
    assert_true(!rejects(label63 + ".com"), "63-char label accepted");
    assert_true(rejects(std::string(64, 'a') + ".com"), "64-char label rejected");

    std::string long_name;
    while (long_name.size() < 251) long_name += "abcdefghi.";
    long_name += "com";
    assert_true(long_name.size() > 253, "fixture is over 253");
    assert_true(rejects(long_name), "name over 253 chars rejected");
}

static void test_url_like_input()
{
    Target t = validate_target("https://Example.com:8443/path?q=1#frag");
    assert_true(t.kind == TargetKind::Domain && t.host == "example.com", "scheme/port/path stripped");

    Target u = validate_target("http://user:pw@10.0.0.1/");
    assert_true(u.kind == TargetKind::Ip && u.host == "10.0.0.1", "userinfo stripped");

    Target p = validate_target("example.org:80");
    assert_true(p.host == "example.org", "host:port reduced");

    assert_true(extract_host("plain.example") == "plain.example", "nothing to strip");
    assert_true(extract_host("ftp://[fe80::1]:21/x") == "fe80::1", "bracketed host extracted");
}

static void test_rejections()
{
    assert_true(rejects(""), "empty rejected");
    assert_true(rejects("   "), "blank rejected");
    assert_true(rejects("!!!bad_host!!!"), "invalid characters rejected");
    assert_true(rejects("under_score.com"), "underscore rejected");
    assert_true(rejects("-lead.com"), "leading hyphen rejected");
    assert_true(rejects("trail-.com"), "trailing hyphen rejected");
    assert_true(rejects("a..b"), "empty label rejected");
    assert_true(rejects("999.999.999.999"), "broken dotted quad rejected");
    assert_true(rejects("1.2.3"), "numeric last label rejected");
    assert_true(rejects("http://"), "scheme without host rejected");
    assert_true(rejects("exa mple.com"), "inner space rejected");
    assert_true(rejects("!!!bad_host!!!://8.8.8.8"), "junk scheme before an IP rejected");
    assert_true(rejects("bad host://example.com"), "scheme with a space rejected");
    assert_true(rejects("$$$://example.com/x"), "symbol scheme rejected");
    assert_true(rejects("1http://example.com"), "scheme must start with a letter");
    assert_true(rejects("://example.com"), "empty scheme rejected");
}

static void test_scheme_forms()
{
    assert_true(validate_target("svn+ssh://example.com").host == "example.com", "plus in scheme");
    assert_true(validate_target("coap.tcp://10.0.0.9").host == "10.0.0.9", "dot in scheme");
    assert_true(validate_target("HTTPS://1.1.1.1/").host == "1.1.1.1", "upper-case scheme");
}

static void test_trim()
{
    assert_true(trim("  a b \t\n") == "a b", "both ends");
    assert_true(trim("\r\n").empty(), "only whitespace");
    assert_true(trim("x") == "x", "nothing to trim");
}

static void test_public_address()
{
    assert_true(is_public_address("8.8.8.8"), "8.8.8.8 public");
    assert_true(is_public_address("1.1.1.1"), "1.1.1.1 public");
    assert_true(!is_public_address("10.255.255.1"), "10/8 private");
    assert_true(!is_public_address("172.16.5.4"), "172.16/12 private");
    assert_true(!is_public_address("192.168.1.1"), "192.168/16 private");
    assert_true(!is_public_address("127.0.0.1"), "loopback");
    assert_true(!is_public_address("169.254.1.1"), "link-local");
    assert_true(!is_public_address("100.64.0.1"), "CGNAT");
    assert_true(!is_public_address("224.0.0.1"), "multicast");
    assert_true(!is_public_address("0.0.0.0"), "unspecified");
    assert_true(!is_public_address("192.0.2.10"), "documentation");
    assert_true(!is_public_address("255.255.255.255"), "broadcast");
    assert_true(is_public_address("172.32.0.1"), "just outside 172.16/12");

    assert_true(is_public_address("2001:4860:4860::8888"), "v6 public");
    assert_true(!is_public_address("::1"), "v6 loopback");
    assert_true(!is_public_address("::"), "v6 unspecified");
    assert_true(!is_public_address("fe80::1"), "v6 link-local");
    assert_true(!is_public_address("fd00::1"), "v6 ULA");
    assert_true(!is_public_address("ff02::1"), "v6 multicast");
    assert_true(!is_public_address("2001:db8::1"), "v6 documentation");
    assert_true(!is_public_address("::ffff:192.168.0.1"), "v4-mapped private");
    assert_true(is_public_address("::ffff:8.8.8.8"), "v4-mapped public");
    assert_true(!is_public_address("not-an-ip"), "garbage is not public");
}

static void test_kind_str()
{
    assert_true(std::string(target_kind_str(TargetKind::Ip)) == "ip", "ip");
    assert_true(std::string(target_kind_str(TargetKind::Domain)) == "domain", "domain");
}

int main()
{
    test_ipv4_literals();
    test_ipv6_literals();
    test_hostnames();
    test_url_like_input();
    test_rejections();
    test_scheme_forms();
    test_trim();
    test_public_address();
    test_kind_str();

    std::cout << "target tests: OK" << std::endl;
    return 0;
}
