#include "dh/cli.hpp"

#include <charconv>
#include <chrono>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <cstdio>
#include <utility>
#include <vector>

#include "dh/wordlist.hpp"

using namespace std::string_view_literals;

namespace dh {

namespace {

// options taking a value: {short, long}
constexpr std::string_view kValueOptions[][2] = {
    {"-d", "--domain"},
    {"-w", "--wordlist"},
    {"-c", "--concurrency"},
    {"-o", "--output"},
    {"", "--timeout"},
    {"", "--retries"},
    {"", "--ns"},
    {"", "--log-file"},
};

// Accepts "--name VALUE" and "--name=VALUE"; `a` must start with `name`.
std::optional<std::string> option_value(std::string_view a,
                                        std::string_view name,
                                        int &i,
                                        int argc,
                                        char **argv)
{
    if (a == name)
    {
        if (i + 1 < argc) return std::string(argv[++i]);
        return std::nullopt;
    }
    if (a.size() > name.size() + 1 && a[name.size()] == '=')
        return std::string(a.substr(name.size() + 1));
    return std::nullopt;
}

bool matches(std::string_view a, std::string_view name)
{
    return a == name || (a.starts_with(name) && a.size() > name.size() && a[name.size()] == '=');
}

std::optional<int> to_int(std::string_view s)
{
    int v = 0;
    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
    return v;
}

} // namespace

void print_usage(const char *prog)
{
    std::println("High-Performance Subdomain Scanner");
    std::println("Usage: {} -d <domain> -w <wordlist> [options]", prog);
    std::println("Options:");
    std::println("  -d, --domain D       The target domain name (required)");
    std::println("  -w, --wordlist F     The wordlist file, one label per line (required)");
    std::println(
        "  -c, --concurrency N  Number of concurrent lookups (default: 50)");
    std::println("  -o, --output F       File to save the results");
    std::println(
        "  --timeout MS         Per-lookup timeout in milliseconds (default: 2000)");
    std::println(
        "  --retries N          Retries on timeout/network error (default: 1)");
    std::println("  --ns SERVER          DNS server IP (default: /etc/resolv.conf)");
    std::println(
        "  --tcp                Force TCP transport (default: UDP with TCP fallback)");
    std::println("  --json               Write the results file as NDJSON");
    std::println("  --no-progress        Do not draw the progress bar");
    std::println(
        "  --log-file F         Error log file (default: scanner_errors.log)");
    std::println("  -v, --verbose        Debug logging, mirrored to stderr");
    std::println("  -h, --help           Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {} -d example.com -w words.txt", prog);
    std::println("  {} -d example.com -w words.txt -c 200 -o found.txt", prog);
}

ParseStatus parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return ParseStatus::Help;
        }

        std::string_view key;
        std::optional<std::string> val;
        for (const auto &names: kValueOptions)
        {
            if (!names[0].empty() && a == names[0])
            {
                key = names[1];
                if (i + 1 < argc) val = std::string(argv[++i]);
                break;
            }
            if (matches(a, names[1]))
            {
                key = names[1];
                val = option_value(a, names[1], i, argc, argv);
                break;
            }
        }

        if (!key.empty())
        {
            if (!val)
            {
                std::println(stderr, "missing value for {}", key);
                return ParseStatus::Error;
            }
            if (key == "--domain"sv) opt.domain = *val;
            else if (key == "--wordlist"sv) opt.wordlist = *val;
            else if (key == "--output"sv) opt.output = *val;
            else if (key == "--ns"sv) opt.ns = *val;
            else if (key == "--log-file"sv) opt.log_file = *val;
            else
            {
                auto n = to_int(*val);
                if (!n)
                {
                    std::println(stderr, "invalid {} value: {}", key, *val);
                    return ParseStatus::Error;
                }
                if (key == "--concurrency"sv)
                {
                    if (*n <= 0)
                    {
                        std::println(stderr, "concurrency must be a positive integer: {}", *val);
                        return ParseStatus::Error;
                    }
                    opt.concurrency = *n;
                }
                else if (key == "--timeout"sv)
                {
                    if (*n <= 0)
                    {
                        std::println(stderr, "timeout must be positive: {}", *val);
                        return ParseStatus::Error;
                    }
                    opt.timeout_ms = *n;
                }
                else
                {
                    if (*n < 0)
                    {
                        std::println(stderr, "retries must not be negative: {}", *val);
                        return ParseStatus::Error;
                    }
                    opt.retries = *n;
                }
            }
        }
        else if (a == "--tcp"sv)
        {
            opt.tcp = true;
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "--no-progress"sv)
        {
            opt.progress = false;
        }
        else if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.verbose = true;
        }
        else
        {
            std::println(stderr, "unknown argument: {}", a);
            return ParseStatus::Error;
        }
    }
    if (opt.domain.empty() || opt.wordlist.empty())
    {
        std::println(stderr, "both --domain and --wordlist are required");
        return ParseStatus::Error;
    }
    return ParseStatus::Ok;
}

ScanConfig make_scan_config(const Options &opt)
{
    ScanConfig cfg;
    cfg.domain = opt.domain;
    cfg.wordlist = [path = opt.wordlist] { return load_wordlist(path); };
    cfg.concurrency = opt.concurrency;
    cfg.timeout = std::chrono::milliseconds(opt.timeout_ms);
    cfg.retries = opt.retries;
    return cfg;
}

ScanConfig make_scan_config(const Options &opt, std::vector<std::string> labels)
{
    ScanConfig cfg = make_scan_config(opt);
    cfg.wordlist = [labels = std::move(labels)] { return labels; };
    return cfg;
}

ResolverOptions make_resolver_options(const Options &opt)
{
    ResolverOptions r;
    r.ns = opt.ns;
    r.tcp = opt.tcp;
    return r;
}

} // namespace dh
