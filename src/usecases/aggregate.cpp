#include "dh/aggregate.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace dh {

ResultAggregator::ResultAggregator(std::size_t total)
    : total_(total)
{}

void ResultAggregator::record(ResolutionOutcome outcome)
{
    if (auto* r = std::get_if<Resolved>(&outcome))
    {
        std::string key = r->candidate.fqdn;
        Resolved copy = *r;
        std::scoped_lock lk(mtx_);
        if (completed_ >= total_) throw std::logic_error("outcome recorded past total");
        ++completed_;
        resolved_.insert_or_assign(std::move(key), std::move(*r));
        fresh_.push_back(std::move(copy));
        return;
    }

    const auto reason = std::get<Unresolved>(outcome).reason;
    std::scoped_lock lk(mtx_);
    if (completed_ >= total_) throw std::logic_error("outcome recorded past total");
    ++completed_;
    switch (reason)
    {
        case FailureReason::NameNotFound: ++failures_.name_not_found; break;
        case FailureReason::Timeout: ++failures_.timeout; break;
        case FailureReason::NetworkError: ++failures_.network_error; break;
        case FailureReason::Other: ++failures_.other; break;
    }
}

Progress ResultAggregator::snapshot() const
{
    std::scoped_lock lk(mtx_);
    return Progress{completed_, total_, resolved_.size()};
}

ReasonCounts ResultAggregator::failures() const
{
    std::scoped_lock lk(mtx_);
    return failures_;
}

std::vector<Resolved> ResultAggregator::drain_fresh()
{
    std::vector<Resolved> out;
    std::scoped_lock lk(mtx_);
    out.swap(fresh_);
    return out;
}

std::vector<Resolved> ResultAggregator::results() const
{
    std::vector<Resolved> out;
    {
        std::scoped_lock lk(mtx_);
        out.reserve(resolved_.size());
        for (const auto& [fqdn, r] : resolved_) out.push_back(r);
    }
    std::ranges::sort(out, {}, [](const Resolved& r) -> const std::string& { return r.candidate.fqdn; });
    return out;
}

} // namespace dh
