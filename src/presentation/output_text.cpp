#include "dh/output.hpp"

#include <algorithm>
#include <sstream>
#include <iomanip>

#include "dh/options.hpp"
#include "dh/model.hpp"

namespace dh {

namespace {
constexpr const char* kGreen = "\x1b[32m";
constexpr const char* kCyan = "\x1b[36m";
constexpr const char* kYellow = "\x1b[33m";
constexpr const char* kReset = "\x1b[0m";

std::string join_addresses(const std::vector<std::string>& addrs)
{
    std::string out;
    for (size_t i = 0; i < addrs.size(); ++i)
    {
        if (i) out += ", ";
        out += addrs[i];
    }
    return out;
}
} // namespace

std::string format_banner()
{
    return "DomainHunter - subdomain scanner\n"
           "================================\n\n";
}

std::string format_header_text(const Options& opt)
{
    std::ostringstream os;
    os << "Starting scan for domain: " << opt.domain << '\n';
    os << "Wordlist: " << opt.wordlist
       << "  Concurrency: " << opt.concurrency << '\n';
    os << "Timeout: " << opt.timeout_ms << "ms"
       << "  Retries: " << opt.retries
       << "  NS: " << (opt.ns.empty() ? "(system)" : opt.ns.c_str())
       << "  TCP: " << (opt.tcp ? "on" : "off") << '\n';
    os << "Output: " << (opt.output.empty() ? "(none)" : opt.output.c_str())
       << "  JSON: " << (opt.json ? "on" : "off") << '\n';
    return os.str();
}

std::string format_resolved_text(const Resolved& r, bool color)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    if (color)
    {
        os << kGreen << r.candidate.fqdn << kReset << " -> "
           << kCyan << join_addresses(r.addresses) << kReset << " ("
           << kYellow << r.ms / 1000.0 << "s" << kReset << ")\n";
    }
    else
    {
        os << r.candidate.fqdn << " -> " << join_addresses(r.addresses)
           << " (" << r.ms / 1000.0 << "s)\n";
    }
    return os.str();
}

std::string format_progress_bar(const Progress& p, int width)
{
    width = std::max(width, 1);
    const size_t pct = p.total == 0 ? 100 : std::min<size_t>(p.completed * 100 / p.total, 100);
    const int filled = static_cast<int>(pct * static_cast<size_t>(width) / 100);

    std::ostringstream os;
    os << "Scanning Subdomains... [" << std::string(filled, '#')
       << std::string(width - filled, ' ') << "] "
       << std::setw(3) << pct << "% "
       << p.completed << '/' << p.total
       << " (" << p.resolved << " found)";
    return os.str();
}

std::string format_summary_text(const ScanReport& report)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << "Scanned " << report.progress.completed << '/' << report.progress.total
       << " candidates in " << report.elapsed_ms / 1000.0 << "s"
       << (report.cancelled ? " (interrupted)" : "") << '\n';
    os << "Resolved: " << report.progress.resolved << '\n';
    os << "Unresolved: name-not-found=" << report.failures.name_not_found
       << " timeout=" << report.failures.timeout
       << " network-error=" << report.failures.network_error
       << " other=" << report.failures.other << '\n';
    return os.str();
}

std::string format_result_line(const Resolved& r)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(2);
    os << r.candidate.fqdn << " -> " << join_addresses(r.addresses) << ' ' << r.ms / 1000.0;
    return os.str();
}

} // namespace dh
