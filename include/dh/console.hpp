#pragma once

#include <ostream>
#include <string>

namespace dh
{
struct Progress;
struct Resolved;
struct ScanReport;

// Live terminal output of a scan: found lines, a redrawn progress bar and
// the closing lines. Not thread safe; ScanHooks and the output sink call it
// from the scan's controller thread only.
class ConsoleReporter
{
public:
    ConsoleReporter(std::ostream &out, bool color, int bar_width);

    void found(const Resolved &r);
    void progress(const Progress &p);

    // Ends the progress line; an interrupted scan is announced once, before
    // anything else the end of the scan prints.
    void finish(const ScanReport &report);

    void results_saved(const std::string &path);
    void summary(const ScanReport &report);

private:
    void close_bar();

    std::ostream &out_;
    bool color_;
    int bar_width_;
    bool bar_open_ = false;
    bool finished_ = false;
};
} // namespace dh
