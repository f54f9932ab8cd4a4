#include "ipt/rawdns.hpp"

#include <chrono>
#include <string>
#include <vector>
#include <sys/socket.h>
#include <sys/time.h>

#include <ldns/ldns.h>

namespace ipt
{
static void collect_answers(ldns_pkt *pkt,
                            ldns_rr_type type,
                            int af,
                            std::vector<ResolvedAddress> &out)
{
    ldns_rr_list *rrs = ldns_pkt_rr_list_by_type(pkt, type, LDNS_SECTION_ANSWER);
    if (!rrs) return;
    for (size_t i = 0; i < ldns_rr_list_rr_count(rrs); ++i)
    {
        ldns_rdf *rdf = ldns_rr_rdf(ldns_rr_list_rr(rrs, i), 0);
        if (!rdf) continue;
        if (char *s = ldns_rdf2str(rdf))
        {
            out.push_back(ResolvedAddress{af, std::string(s)});
            LDNS_FREE(s);
        }
    }
    ldns_rr_list_deep_free(rrs);
}

RawDnsResult resolve_rawdns_once(const std::string &host,
                                 const std::vector<std::string> &nameservers,
                                 int timeout_ms)
{
    RawDnsResult out{};
    auto t0 = std::chrono::steady_clock::now();
    auto finish = [&](int rc, RawDnsErrorKind kind, std::string error)
    {
        auto t1 = std::chrono::steady_clock::now();
        out.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
        out.rc = rc;
        out.kind = kind;
        out.error = std::move(error);
    };

    ldns_resolver *res = ldns_resolver_new();
    if (!res)
    {
        finish(-1, RawDnsErrorKind::InitFailed, "ldns_resolver init failed");
        return out;
    }

    for (const auto &ns: nameservers)
    {
        ldns_rdf *ns_rdf = nullptr;
        if (ns.find(':') != std::string::npos)
        {
            ns_rdf = ldns_rdf_new_frm_str(LDNS_RDF_TYPE_AAAA, ns.c_str());
        }
        else
        {
            ns_rdf = ldns_rdf_new_frm_str(LDNS_RDF_TYPE_A, ns.c_str());
        }
        if (!ns_rdf) continue;
        (void) ldns_resolver_push_nameserver(res, ns_rdf);
        ldns_rdf_deep_free(ns_rdf);
    }
    if (ldns_resolver_nameserver_count(res) == 0)
    {
        ldns_resolver_deep_free(res);
        finish(-1, RawDnsErrorKind::InitFailed, "no usable fallback nameserver");
        return out;
    }

    ldns_resolver_set_recursive(res, true);
    ldns_resolver_set_fallback(res, true);
    ldns_resolver_set_retry(res, 1);
    if (timeout_ms >= 0)
    {
        struct timeval tv{
            .tv_sec = timeout_ms / 1000,
            .tv_usec = (timeout_ms % 1000) * 1000
        };
        ldns_resolver_set_timeout(res, tv);
    }
    ldns_resolver_set_edns_udp_size(res, 1232);

    ldns_rdf *name = ldns_dname_new_frm_str(host.c_str());
    if (!name)
    {
        ldns_resolver_deep_free(res);
        finish(-1, RawDnsErrorKind::InvalidQname, "invalid qname");
        return out;
    }

    static const std::pair<ldns_rr_type, int> kQueries[] = {
        {LDNS_RR_TYPE_A, AF_INET},
        {LDNS_RR_TYPE_AAAA, AF_INET6},
    };
    bool any_ok = false;
    for (const auto &[qtype, af]: kQueries)
    {
        ldns_pkt *pkt = nullptr;
        ldns_status st = ldns_resolver_query_status(
            &pkt,
            res,
            name,
            qtype,
            LDNS_RR_CLASS_IN,
            LDNS_RD);
        if (st != LDNS_STATUS_OK || !pkt)
        {
            if (pkt) ldns_pkt_free(pkt);
            continue;
        }
        any_ok = true;
        collect_answers(pkt, qtype, af, out.addresses);
        ldns_pkt_free(pkt);
    }

    ldns_rdf_deep_free(name);
    ldns_resolver_deep_free(res);

    if (!any_ok)
    {
        finish(-1, RawDnsErrorKind::QueryFailed, "ldns query failed");
    }
    else if (out.addresses.empty())
    {
        finish(-1, RawDnsErrorKind::QueryFailed, "no A/AAAA answers");
    }
    else
    {
        finish(0, RawDnsErrorKind::None, {});
    }
    return out;
}
} // namespace ipt
