#include <cstdlib>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "dh/errors.hpp"
#include "dh/results_file.hpp"
#include "dh/wordlist.hpp"

using namespace dh;
namespace fs = std::filesystem;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static std::string read_all(const fs::path& p)
{
    std::ifstream in(p);
    std::ostringstream os;
    os << in.rdbuf();
    return os.str();
}

static fs::path temp_file(const char* name)
{
    return fs::temp_directory_path() / (std::string("domainhunter_") + name);
}

static void test_parse_strips_and_drops_blank()
{
    std::istringstream in("www\n  mail  \n\n\t\napi\r\n   \ndev");
    auto words = parse_wordlist(in);
    assert_true(words == std::vector<std::string>{"www", "mail", "api", "dev"}, "trimmed, blanks dropped");
}

static void test_load_from_file()
{
    const fs::path p = temp_file("words.txt");
    {
        std::ofstream out(p);
        out << "www\n\nftp\n";
    }
    auto words = load_wordlist(p.string());
    assert_true(words.size() == 2 && words[0] == "www" && words[1] == "ftp", "file labels");
    fs::remove(p);
}

static void test_missing_file_throws()
{
    bool thrown = false;
    try
    {
        (void) load_wordlist("/nonexistent/dir/words.txt");
    }
    catch (const wordlist_error& e)
    {
        thrown = std::string_view(e.what()).find("/nonexistent/dir/words.txt") != std::string_view::npos;
    }
    assert_true(thrown, "missing wordlist -> wordlist_error naming the path");
}

static std::vector<Resolved> sample()
{
    Resolved a{};
    a.candidate = Candidate{"api", "api.example.com"};
    a.addresses = {"192.0.2.10"};
    a.ms = 50.0;
    Resolved b{};
    b.candidate = Candidate{"www", "www.example.com"};
    b.addresses = {"192.0.2.1", "192.0.2.2"};
    b.ms = 1250.0;
    return {a, b};
}

static void test_save_text()
{
    const fs::path p = temp_file("results.txt");
    assert_true(save_results(p.string(), sample(), false), "text save ok");
    assert_true(read_all(p) ==
                "api.example.com -> 192.0.2.10 0.05\n"
                "www.example.com -> 192.0.2.1, 192.0.2.2 1.25\n", "text lines");
    fs::remove(p);
}

static void test_save_ndjson()
{
    const fs::path p = temp_file("results.ndjson");
    assert_true(save_results(p.string(), sample(), true), "ndjson save ok");
    std::istringstream in(read_all(p));
    std::string line;
    int n = 0;
    while (std::getline(in, line))
    {
        assert_true(line.front() == '{' && line.back() == '}', "one object per line");
        ++n;
    }
    assert_true(n == 2, "two ndjson lines");
    fs::remove(p);
}

static void test_save_failure_reported()
{
    assert_true(!save_results("/nonexistent/dir/results.txt", sample(), false), "unwritable path -> false");
}

int main()
{
    spdlog::set_level(spdlog::level::off);

    test_parse_strips_and_drops_blank();
    test_load_from_file();
    test_missing_file_throws();
    test_save_text();
    test_save_ndjson();
    test_save_failure_reported();
    std::cout << "wordlist tests: OK" << std::endl;
    return 0;
}
