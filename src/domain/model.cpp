#include "dh/model.hpp"

#include "dh/errors.hpp"
#include "dh/options.hpp"

namespace dh {

const Candidate& candidate_of(const ResolutionOutcome& outcome)
{
    return std::visit([](const auto& o) -> const Candidate& { return o.candidate; }, outcome);
}

int attempts_of(const ResolutionOutcome& outcome)
{
    return std::visit([](const auto& o) { return o.attempts; }, outcome);
}

const char* reason_str(FailureReason reason)
{
    switch (reason)
    {
        case FailureReason::NameNotFound: return "name-not-found";
        case FailureReason::Timeout: return "timeout";
        case FailureReason::NetworkError: return "network-error";
        case FailureReason::Other: return "other";
    }
    return "other";
}

void validate_config(const ScanConfig& cfg)
{
    if (cfg.domain.empty()) throw config_error("domain must not be empty");
    if (cfg.concurrency <= 0) throw config_error("concurrency must be a positive integer");
    if (cfg.retries < 0) throw config_error("retries must not be negative");
    if (cfg.timeout.count() <= 0) throw config_error("timeout must be positive");
    if (cfg.progress_interval.count() <= 0) throw config_error("progress interval must be positive");
    if (!cfg.wordlist) throw config_error("no wordlist source");
}

} // namespace dh
