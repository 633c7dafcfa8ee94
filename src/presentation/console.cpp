#include "dh/console.hpp"

#include "dh/model.hpp"
#include "dh/output.hpp"

namespace dh
{
namespace
{
constexpr const char *kClearLine = "\r\x1b[2K";
}

ConsoleReporter::ConsoleReporter(std::ostream &out, bool color, int bar_width)
    : out_(out), color_(color), bar_width_(bar_width)
{}

void ConsoleReporter::found(const Resolved &r)
{
    if (bar_open_) out_ << kClearLine;
    bar_open_ = false;
    out_ << format_resolved_text(r, color_);
}

void ConsoleReporter::progress(const Progress &p)
{
    out_ << kClearLine << format_progress_bar(p, bar_width_) << std::flush;
    bar_open_ = true;
}

void ConsoleReporter::close_bar()
{
    if (bar_open_) out_ << '\n';
    bar_open_ = false;
}

void ConsoleReporter::finish(const ScanReport &report)
{
    close_bar();
    if (finished_) return;
    finished_ = true;
    if (report.cancelled) out_ << "Scan interrupted by user.\n";
}

void ConsoleReporter::results_saved(const std::string &path)
{
    out_ << "Results saved to: " << path << '\n';
}

void ConsoleReporter::summary(const ScanReport &report)
{
    finish(report);
    out_ << format_summary_text(report) << std::flush;
}
} // namespace dh
