#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dh {

struct Candidate {
    std::string label;
    std::string fqdn;   // label + "." + domain
};

enum class FailureReason {
    NameNotFound,   // NXDOMAIN / NODATA, definitive
    Timeout,
    NetworkError,
    Other,
};

struct Resolved {
    Candidate                candidate;
    std::vector<std::string> addresses;
    double                   ms{};        // last attempt
    int                      attempts{1};
};

struct Unresolved {
    Candidate     candidate;
    FailureReason reason{FailureReason::Other};
    std::string   detail;
    double        ms{};
    int           attempts{1};
};

using ResolutionOutcome = std::variant<Resolved, Unresolved>;

const Candidate& candidate_of(const ResolutionOutcome& outcome);

int attempts_of(const ResolutionOutcome& outcome);

inline bool is_resolved(const ResolutionOutcome& outcome)
{
    return std::holds_alternative<Resolved>(outcome);
}

// NetworkError and Timeout may succeed on a second attempt
inline bool is_transient(FailureReason reason)
{
    return reason == FailureReason::NetworkError || reason == FailureReason::Timeout;
}

const char* reason_str(FailureReason reason);

struct Progress {
    std::size_t completed{};
    std::size_t total{};
    std::size_t resolved{};
};

struct ReasonCounts {
    std::size_t name_not_found{};
    std::size_t timeout{};
    std::size_t network_error{};
    std::size_t other{};
};

struct ScanReport {
    Progress              progress;
    ReasonCounts          failures;
    std::vector<Resolved> resolved;   // sorted by fqdn
    bool                  cancelled{};
    double                elapsed_ms{};
};

} // namespace dh
