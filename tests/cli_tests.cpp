#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "dh/cli.hpp"

using namespace dh;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static ParseStatus parse(std::vector<std::string> args, Options& opt)
{
    args.insert(args.begin(), "domainhunter");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(args.size()), argv.data(), opt);
}

static void test_defaults()
{
    Options opt;
    assert_true(parse({"-d", "example.com", "-w", "words.txt"}, opt) == ParseStatus::Ok, "minimal args");
    assert_true(opt.domain == "example.com" && opt.wordlist == "words.txt", "required values");
    assert_true(opt.concurrency == 50, "default concurrency 50");
    assert_true(opt.timeout_ms == 2000 && opt.retries == 1, "default timeout/retries");
    assert_true(opt.output.empty() && !opt.json && !opt.tcp, "default flags");
    assert_true(opt.log_file == "scanner_errors.log", "default log file");
}

static void test_long_and_equals_forms()
{
    Options opt;
    auto st = parse({"--domain=example.org", "--wordlist", "w.txt", "--concurrency=200",
                     "-o", "out.txt", "--timeout", "750", "--retries=0", "--ns=1.1.1.1",
                     "--tcp", "--json", "--no-progress", "--log-file=err.log", "-v"}, opt);
    assert_true(st == ParseStatus::Ok, "long forms parse");
    assert_true(opt.domain == "example.org" && opt.wordlist == "w.txt", "long values");
    assert_true(opt.concurrency == 200 && opt.output == "out.txt", "concurrency/output");
    assert_true(opt.timeout_ms == 750 && opt.retries == 0, "timeout/retries");
    assert_true(opt.ns == "1.1.1.1" && opt.tcp && opt.json && !opt.progress, "resolver/output flags");
    assert_true(opt.log_file == "err.log" && opt.verbose, "logging flags");
}

static void test_rejects_bad_values()
{
    const std::vector<std::vector<std::string>> bad = {
        {"-d", "example.com", "-w", "w.txt", "-c", "0"},
        {"-d", "example.com", "-w", "w.txt", "-c", "-4"},
        {"-d", "example.com", "-w", "w.txt", "-c", "ten"},
        {"-d", "example.com", "-w", "w.txt", "--timeout", "0"},
        {"-d", "example.com", "-w", "w.txt", "--retries=-1"},
        {"-d", "example.com", "-w", "w.txt", "--bogus"},
        {"-d", "example.com", "-w"},
        {"-w", "w.txt"},
        {"-d", "example.com"},
    };
    for (const auto& args : bad)
    {
        Options opt;
        assert_true(parse(args, opt) == ParseStatus::Error, "invalid args rejected");
    }
}

static void test_help()
{
    Options opt;
    assert_true(parse({"--help"}, opt) == ParseStatus::Help, "--help");
    assert_true(parse({"-d", "x.com", "-h"}, opt) == ParseStatus::Help, "-h");
}

static void test_make_scan_config()
{
    Options opt;
    opt.domain = "example.com";
    opt.wordlist = "/nonexistent/words.txt";
    opt.concurrency = 12;
    opt.timeout_ms = 900;
    opt.retries = 3;

    ScanConfig cfg = make_scan_config(opt, {"www", "mail"});
    assert_true(cfg.domain == "example.com" && cfg.concurrency == 12, "config basics");
    assert_true(cfg.timeout.count() == 900 && cfg.retries == 3, "config timeout/retries");
    assert_true(cfg.wordlist().size() == 2, "preloaded labels");
    assert_true(!cfg.output, "no output sink by default");

    ScanConfig lazy = make_scan_config(opt);
    bool thrown = false;
    try
    {
        (void) lazy.wordlist();
    }
    catch (const std::exception&)
    {
        thrown = true;
    }
    assert_true(thrown, "lazy source reads the file on demand");

    opt.ns = "8.8.8.8";
    opt.tcp = true;
    ResolverOptions r = make_resolver_options(opt);
    assert_true(r.ns == "8.8.8.8" && r.tcp && r.rd, "resolver options");
}

int main()
{
    spdlog::set_level(spdlog::level::off);

    test_defaults();
    test_long_and_equals_forms();
    test_rejects_bad_values();
    test_help();
    test_make_scan_config();
    std::cout << "cli tests: OK" << std::endl;
    return 0;
}
