#include "dh/resolver.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <sys/time.h>

#include <ldns/ldns.h>

#include "dh/errors.hpp"

namespace dh
{
namespace
{
using Clock = std::chrono::steady_clock;

timeval to_timeval(std::chrono::milliseconds ms)
{
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

using NameserverPtr = std::shared_ptr<ldns_rdf>;

std::string status_str(ldns_status st)
{
    const char *s = ldns_get_errorstr_by_id(st);
    return s ? std::string(s) : std::string("ldns error");
}

NameserverPtr make_nameserver(ldns_rdf *rdf)
{
    return NameserverPtr(rdf, [](ldns_rdf *r) { ldns_rdf_deep_free(r); });
}

// Address of the server every lookup goes to: --ns, or the first entry of
// /etc/resolv.conf
NameserverPtr load_nameserver(const ResolverOptions &opt)
{
    if (!opt.ns.empty())
    {
        const ldns_rdf_type type = opt.ns.find(':') != std::string::npos
                                       ? LDNS_RDF_TYPE_AAAA
                                       : LDNS_RDF_TYPE_A;
        ldns_rdf *rdf = ldns_rdf_new_frm_str(type, opt.ns.c_str());
        if (!rdf) throw config_error(std::format("invalid nameserver address '{}'", opt.ns));
        return make_nameserver(rdf);
    }

    ldns_resolver *sys = nullptr;
    const ldns_status st = ldns_resolver_new_frm_file(&sys, nullptr);
    if (st != LDNS_STATUS_OK || !sys)
    {
        if (sys) ldns_resolver_deep_free(sys);
        throw config_error(std::format("cannot read system resolver configuration: {}", status_str(st)));
    }
    ldns_rdf *first = ldns_resolver_nameserver_count(sys) > 0
                          ? ldns_rdf_clone(ldns_resolver_nameservers(sys)[0])
                          : nullptr;
    ldns_resolver_deep_free(sys);
    if (!first) throw config_error("no nameserver in system resolver configuration");
    return make_nameserver(first);
}

// One server, one try: keeps a query inside its timeout window.
ldns_resolver *new_resolver(ldns_rdf *ns, const ResolverOptions &opt)
{
    ldns_resolver *res = ldns_resolver_new();
    if (!res) return nullptr;
    if (ldns_resolver_push_nameserver(res, ns) != LDNS_STATUS_OK)
    {
        ldns_resolver_deep_free(res);
        return nullptr;
    }
    ldns_resolver_set_port(res, static_cast<uint16_t>(opt.port));
    ldns_resolver_set_retry(res, 1);
    ldns_resolver_set_retrans(res, 0);
    ldns_resolver_set_recursive(res, opt.rd);
    ldns_resolver_set_usevc(res, opt.tcp);
    ldns_resolver_set_fallback(res, true);
    ldns_resolver_set_edns_udp_size(res, 1232);
    return res;
}

std::vector<std::string> collect_addresses(const ldns_pkt *pkt, ldns_rr_type type)
{
    std::vector<std::string> out;
    ldns_rr_list *rrs = ldns_pkt_rr_list_by_type(pkt, type, LDNS_SECTION_ANSWER);
    if (!rrs) return out;
    const size_t n = ldns_rr_list_rr_count(rrs);
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        ldns_rdf *addr = ldns_rr_a_address(ldns_rr_list_rr(rrs, i));
        if (!addr) continue;
        if (char *s = ldns_rdf2str(addr))
        {
            out.emplace_back(s);
            LDNS_FREE(s);
        }
    }
    ldns_rr_list_deep_free(rrs);
    return out;
}

ResolutionOutcome lookup(const Candidate &candidate,
                         std::chrono::milliseconds timeout,
                         ldns_rdf *ns,
                         const ResolverOptions &opt)
{
    const auto t0 = Clock::now();
    auto elapsed = [&]
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0);
    };
    auto elapsed_ms = [&]
    {
        return std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    };
    auto fail = [&](FailureReason reason, std::string detail) -> ResolutionOutcome
    {
        Unresolved u{};
        u.candidate = candidate;
        u.reason = reason;
        u.detail = std::move(detail);
        u.ms = elapsed_ms();
        return u;
    };

    ldns_resolver *res = new_resolver(ns, opt);
    if (!res) return fail(FailureReason::Other, "ldns_resolver init failed");

    ldns_rdf *name = ldns_dname_new_frm_str(candidate.fqdn.c_str());
    if (!name)
    {
        ldns_resolver_deep_free(res);
        return fail(FailureReason::Other, "invalid qname");
    }

    std::vector<std::string> addresses;
    std::string failure;
    FailureReason reason = FailureReason::NameNotFound;
    bool failed = false;

    for (ldns_rr_type type : {LDNS_RR_TYPE_A, LDNS_RR_TYPE_AAAA})
    {
        const auto remaining = timeout - elapsed();
        if (remaining.count() <= 0)
        {
            failed = true;
            reason = FailureReason::Timeout;
            failure = "timed out";
            break;
        }
        ldns_resolver_set_timeout(res, to_timeval(remaining));

        ldns_pkt *pkt = nullptr;
        ldns_status st = ldns_resolver_query_status(
            &pkt, res, name, type, LDNS_RR_CLASS_IN, opt.rd ? LDNS_RD : 0);
        if (st != LDNS_STATUS_OK || !pkt)
        {
            if (pkt) ldns_pkt_free(pkt);
            failed = true;
            reason = elapsed() >= timeout ? FailureReason::Timeout
                                          : FailureReason::NetworkError;
            failure = status_str(st);
            break;
        }

        const ldns_pkt_rcode rcode = ldns_pkt_get_rcode(pkt);
        if (rcode != LDNS_RCODE_NOERROR)
        {
            ldns_pkt_free(pkt);
            failed = true;
            if (rcode == LDNS_RCODE_NXDOMAIN)
            {
                reason = FailureReason::NameNotFound;
                failure = "NXDOMAIN";
            }
            else if (rcode == LDNS_RCODE_SERVFAIL)
            {
                reason = FailureReason::NetworkError;
                failure = "SERVFAIL";
            }
            else
            {
                reason = FailureReason::Other;
                failure = "rcode " + std::to_string(static_cast<int>(rcode));
            }
            break;
        }

        addresses = collect_addresses(pkt, type);
        ldns_pkt_free(pkt);
        if (!addresses.empty()) break;
    }

    ldns_rdf_deep_free(name);
    ldns_resolver_deep_free(res);

    if (failed) return fail(reason, std::move(failure));
    if (addresses.empty()) return fail(FailureReason::NameNotFound, "no address records");

    Resolved r{};
    r.candidate = candidate;
    r.addresses = std::move(addresses);
    r.ms = elapsed_ms();
    return r;
}

} // namespace

Resolver make_ldns_resolver(ResolverOptions opt)
{
    if (opt.port <= 0 || opt.port > 65535)
        throw config_error(std::format("invalid nameserver port {}", opt.port));
    NameserverPtr ns = load_nameserver(opt);
    return [ns = std::move(ns), opt = std::move(opt)](const Candidate &candidate,
                                                      std::chrono::milliseconds timeout)
    {
        return lookup(candidate, timeout, ns.get(), opt);
    };
}
} // namespace dh
