#pragma once

#include <chrono>
#include <functional>

#include "dh/model.hpp"
#include "dh/options.hpp"

namespace dh
{
// Single lookup capability: one forward query for candidate.fqdn bounded by
// the timeout. Implementations must be callable from several threads at once
// and report every failure through the returned outcome.
using Resolver = std::function<ResolutionOutcome(const Candidate &,
                                                 std::chrono::milliseconds)>;

// ldns based lookup (A, then AAAA when no A record is present).
// The nameserver is parsed once here; an unusable address or an unreadable
// /etc/resolv.conf throws config_error. Each call builds a private
// ldns_resolver from that address.
Resolver make_ldns_resolver(ResolverOptions opt);
} // namespace dh
