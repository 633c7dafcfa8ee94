#pragma once

#include <atomic>
#include <chrono>
#include <functional>

#include "dh/aggregate.hpp"
#include "dh/candidates.hpp"
#include "dh/concurrency.hpp"
#include "dh/model.hpp"
#include "dh/options.hpp"
#include "dh/resolver.hpp"

namespace dh {

struct SchedulerOptions {
    int concurrency = 50;
    std::chrono::milliseconds timeout{2000};
    int retries = 1;
};

// Called on the worker thread right before the outcome is recorded
using OutcomeCallback = std::function<void(const ResolutionOutcome&)>;
using FoundCallback = std::function<void(const Resolved&)>;

// One candidate, retried while the failure is transient, the retry budget
// lasts and the scan is not cancelled. Each attempt gets a fresh timeout.
// An exception escaping the resolver is folded into Unresolved{Other}.
ResolutionOutcome resolve_with_retry(const Candidate& candidate,
                                     const Resolver& resolve,
                                     std::chrono::milliseconds timeout,
                                     int retries,
                                     const std::atomic<bool>& cancel);

// Drains `source` with min(concurrency, total) workers and records exactly
// one final outcome per dispatched candidate. Returns once all workers have
// exited; on cancellation the undispatched candidates are left in `source`.
void run_scheduler(CandidateGenerator& source,
                   const Resolver& resolve,
                   ResultAggregator& sink,
                   const SchedulerOptions& opt,
                   Cancellation& cancel,
                   const OutcomeCallback& on_outcome = {});

struct ScanHooks {
    ProgressSink on_progress;     // every progress interval and once at the end
    FoundCallback on_found;       // each new resolved entry, controller thread
    OutcomeCallback on_outcome;   // every final outcome, worker threads
};

// Run controller for a single scan.
class Scanner {
public:
    Scanner(ScanConfig cfg, Resolver resolver);

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    // Blocks until every candidate is done or the scan is cancelled, then
    // passes the report to cfg.output (when set) and returns it.
    // Throws config_error before any lookup when the configuration or the
    // wordlist source is unusable; throws std::logic_error on a second call.
    ScanReport run(const ScanHooks& hooks = {});

    // Idempotent, callable from any thread, before or during run()
    void cancel();
    bool cancelled() const { return cancel_.is_cancelled(); }

private:
    ScanConfig cfg_;
    Resolver resolver_;
    Cancellation cancel_;
    std::atomic<bool> started_{false};
};

} // namespace dh
