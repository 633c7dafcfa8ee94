#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "dh/model.hpp"

namespace dh {

// Synchronized collector of outcomes for one scan.
// Every operation holds the lock for O(1) work (results() excepted).
class ResultAggregator {
public:
    explicit ResultAggregator(std::size_t total);

    ResultAggregator(const ResultAggregator&) = delete;
    ResultAggregator& operator=(const ResultAggregator&) = delete;

    // Counts the outcome as completed; a Resolved outcome is stored keyed
    // by fqdn (a duplicate candidate replaces the earlier entry).
    // Throws std::logic_error if more outcomes than `total` are recorded.
    void record(ResolutionOutcome outcome);

    Progress snapshot() const;

    ReasonCounts failures() const;

    // Resolved entries recorded since the previous call
    std::vector<Resolved> drain_fresh();

    // Resolved set sorted by fqdn
    std::vector<Resolved> results() const;

private:
    mutable std::mutex mtx_;
    std::size_t total_;
    std::size_t completed_{0};
    ReasonCounts failures_{};
    std::unordered_map<std::string, Resolved> resolved_;
    std::vector<Resolved> fresh_;
};

} // namespace dh
