#include "dh/scanner.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <format>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "dh/errors.hpp"

namespace dh {

ResolutionOutcome resolve_with_retry(const Candidate& candidate,
                                     const Resolver& resolve,
                                     std::chrono::milliseconds timeout,
                                     int retries,
                                     const std::atomic<bool>& cancel)
{
    for (int attempt = 1;; ++attempt)
    {
        auto failed = [&](std::string detail) -> ResolutionOutcome {
            Unresolved u{};
            u.candidate = candidate;
            u.reason = FailureReason::Other;
            u.detail = std::move(detail);
            return u;
        };
        ResolutionOutcome out = [&]() -> ResolutionOutcome {
            try {
                return resolve(candidate, timeout);
            } catch (const std::exception& e) {
                return failed(e.what());
            } catch (...) {
                return failed("unknown exception");
            }
        }();
        std::visit([attempt](auto& o) { o.attempts = attempt; }, out);

        const auto* u = std::get_if<Unresolved>(&out);
        if (!u || !is_transient(u->reason) || attempt > retries ||
            cancel.load(std::memory_order_acquire))
        {
            return out;
        }
        spdlog::debug("retrying {} after {}: {}", candidate.fqdn, reason_str(u->reason), u->detail);
    }
}

void run_scheduler(CandidateGenerator& source,
                   const Resolver& resolve,
                   ResultAggregator& sink,
                   const SchedulerOptions& opt,
                   Cancellation& cancel,
                   const OutcomeCallback& on_outcome)
{
    if (source.total() == 0) return;

    std::mutex src_mtx;
    auto next = [&]() -> std::optional<Candidate> {
        std::scoped_lock lk(src_mtx);
        return source.next();
    };

    const auto cap = static_cast<std::size_t>(std::max(opt.concurrency, 1));
    const int workers = static_cast<int>(std::min(cap, source.total()));

    run_workers(
        workers,
        [&](int, const std::atomic<bool>& flag)
        {
            while (!flag.load(std::memory_order_acquire))
            {
                std::optional<Candidate> c = next();
                if (!c) break;
                ResolutionOutcome outcome = resolve_with_retry(*c, resolve, opt.timeout, opt.retries, flag);
                if (const auto* u = std::get_if<Unresolved>(&outcome);
                    u && u->reason == FailureReason::Other)
                {
                    spdlog::error("Error resolving {}: {}", u->candidate.fqdn, u->detail);
                }
                if (on_outcome) on_outcome(outcome);
                sink.record(std::move(outcome));
            }
        },
        &cancel);
}

Scanner::Scanner(ScanConfig cfg, Resolver resolver)
    : cfg_(std::move(cfg)), resolver_(std::move(resolver))
{}

void Scanner::cancel()
{
    if (cancel_.cancel()) spdlog::info("scan of {} cancelled", cfg_.domain);
}

ScanReport Scanner::run(const ScanHooks& hooks)
{
    if (started_.exchange(true)) throw std::logic_error("Scanner::run may only be called once");
    validate_config(cfg_);
    if (!resolver_) throw config_error("no resolver");

    std::vector<std::string> labels;
    try {
        labels = cfg_.wordlist();
    } catch (const std::exception& e) {
        throw config_error(std::format("cannot read wordlist: {}", e.what()));
    }

    CandidateGenerator source(cfg_.domain, std::move(labels));
    ResultAggregator agg(source.total());
    const SchedulerOptions sched{cfg_.concurrency, cfg_.timeout, cfg_.retries};

    spdlog::info("scan started: domain={} candidates={} concurrency={} timeout={}ms",
                 source.domain(), source.total(), cfg_.concurrency, cfg_.timeout.count());
    const auto t0 = std::chrono::steady_clock::now();

    std::mutex done_mtx;
    std::condition_variable done_cv;
    bool done = false;
    std::exception_ptr scan_ex;

    std::thread scheduler([&] {
        try {
            run_scheduler(source, resolver_, agg, sched, cancel_, hooks.on_outcome);
        } catch (...) {
            scan_ex = std::current_exception();
        }
        {
            std::scoped_lock lk(done_mtx);
            done = true;
        }
        done_cv.notify_all();
    });

    auto report_progress = [&] {
        for (const Resolved& r : agg.drain_fresh())
        {
            if (hooks.on_found) hooks.on_found(r);
        }
        if (hooks.on_progress) hooks.on_progress(agg.snapshot());
    };

    std::exception_ptr hook_ex;
    try {
        std::unique_lock lk(done_mtx);
        while (!done)
        {
            done_cv.wait_for(lk, cfg_.progress_interval, [&] { return done; });
            if (done) break;
            lk.unlock();
            report_progress();
            lk.lock();
        }
    } catch (...) {
        hook_ex = std::current_exception();
        cancel_.cancel();
    }
    scheduler.join();

    if (scan_ex) std::rethrow_exception(scan_ex);
    if (hook_ex) std::rethrow_exception(hook_ex);
    report_progress();

    ScanReport report{};
    report.progress = agg.snapshot();
    report.failures = agg.failures();
    report.resolved = agg.results();
    report.cancelled = cancel_.is_cancelled();
    report.elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();

    spdlog::info("scan finished: {}/{} done, {} resolved{}",
                 report.progress.completed, report.progress.total,
                 report.progress.resolved, report.cancelled ? " (cancelled)" : "");

    if (cfg_.output) cfg_.output(report);
    return report;
}

} // namespace dh
