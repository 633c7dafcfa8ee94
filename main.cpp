// DomainHunter: concurrent subdomain scanner (C++23)

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>
#include <print>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "dh/cli.hpp"
#include "dh/console.hpp"
#include "dh/errors.hpp"
#include "dh/logging.hpp"
#include "dh/output.hpp"
#include "dh/resolver.hpp"
#include "dh/results_file.hpp"
#include "dh/scanner.hpp"
#include "dh/wordlist.hpp"

using namespace std::chrono_literals;

namespace {
std::atomic<bool> g_interrupted{false};

extern "C" void on_sigint(int)
{
    g_interrupted.store(true, std::memory_order_relaxed);
}

constexpr int kBarWidth = 40;
} // namespace

int main(int argc, char **argv)
{
    dh::Options opt;
    switch (dh::parse_args(argc, argv, opt))
    {
        case dh::ParseStatus::Help: return 0;
        case dh::ParseStatus::Error:
            std::println(stderr, "try '{} --help'", argv[0]);
            return 2;
        case dh::ParseStatus::Ok: break;
    }

    dh::setup_logging(opt);

    const bool tty = isatty(STDOUT_FILENO) != 0;
    const bool show_progress = opt.progress && tty;

    std::cout << dh::format_banner() << std::flush;

    std::vector<std::string> words;
    try
    {
        words = dh::load_wordlist(opt.wordlist);
    }
    catch (const dh::wordlist_error &e)
    {
        std::println(stderr, "{}", e.what());
        return 1;
    }
    if (words.empty())
    {
        std::println("No words found in the wordlist. Exiting.");
        return 0;
    }

    // all hooks and the output sink run on the scan's controller thread
    dh::ConsoleReporter console(std::cout, tty, kBarWidth);

    dh::ScanConfig cfg = dh::make_scan_config(opt, std::move(words));
    if (!opt.output.empty())
    {
        cfg.output = [&opt, &console](const dh::ScanReport &report)
        {
            console.finish(report);
            if (dh::save_results(opt.output, report.resolved, opt.json))
                console.results_saved(opt.output);
            else
                std::println(stderr, "Could not save results to {} (see {})", opt.output, opt.log_file);
        };
    }

    dh::ScanHooks hooks;
    hooks.on_found = [&console](const dh::Resolved &r) { console.found(r); };
    if (show_progress)
    {
        hooks.on_progress = [&console](const dh::Progress &p) { console.progress(p); };
    }

    std::cout << dh::format_header_text(opt) << std::flush;

    try
    {
        dh::Scanner scanner(std::move(cfg), dh::make_ldns_resolver(dh::make_resolver_options(opt)));

        std::signal(SIGINT, on_sigint);
        std::jthread watcher([&scanner](std::stop_token st)
        {
            while (!st.stop_requested())
            {
                if (g_interrupted.load(std::memory_order_relaxed))
                {
                    scanner.cancel();
                    return;
                }
                std::this_thread::sleep_for(50ms);
            }
        });

        dh::ScanReport report = scanner.run(hooks);
        watcher.request_stop();

        console.summary(report);
    }
    catch (const dh::config_error &e)
    {
        spdlog::error("Invalid configuration: {}", e.what());
        std::println(stderr, "invalid configuration: {}", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        spdlog::error("Unexpected error: {}", e.what());
        std::println(stderr, "unexpected error: {}", e.what());
        return 1;
    }
    return 0;
}
