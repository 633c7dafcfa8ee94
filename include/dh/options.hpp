#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "dh/model.hpp"

namespace dh
{
// Command line options, filled by parse_args
struct Options
{
    std::string domain;
    std::string wordlist;       // path to wordlist file
    int concurrency = 50;       // number of parallel lookups
    std::string output;         // results file (optional)
    int timeout_ms = 2000;      // per-attempt timeout
    int retries = 1;            // extra attempts on NetworkError/Timeout
    std::string ns;             // nameserver IP; empty = /etc/resolv.conf
    bool tcp = false;           // force TCP transport
    bool json = false;          // NDJSON results file
    bool progress = true;       // progress bar (only when stdout is a tty)
    std::string log_file = "scanner_errors.log";
    bool verbose = false;       // debug log mirrored to stderr
};

// Settings for the ldns-backed resolver
struct ResolverOptions
{
    std::string ns;             // empty = first nameserver of /etc/resolv.conf
    int port = 53;
    bool tcp = false;
    bool rd = true;
};

using LabelSource = std::function<std::vector<std::string>()>;
using ProgressSink = std::function<void(const Progress&)>;
using OutputSink = std::function<void(const ScanReport&)>;

struct ScanConfig
{
    std::string domain;
    LabelSource wordlist;
    int concurrency = 50;
    std::chrono::milliseconds timeout{2000};
    int retries = 1;
    std::chrono::milliseconds progress_interval{100};
    OutputSink output;          // may be empty
};

// Throws config_error on empty domain, non-positive concurrency,
// negative retries/timeout or a missing wordlist source.
void validate_config(const ScanConfig& cfg);
} // namespace dh
