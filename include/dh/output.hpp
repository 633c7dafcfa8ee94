#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dh
{
// Forward declarations to avoid heavy includes in header
struct Options;
struct Progress;
struct Resolved;
struct ScanReport;

std::string json_escape(std::string_view s);

// Text formatting (returns complete text block with trailing newlines when applicable)
std::string format_banner();

std::string format_header_text(const Options &opt);

// "<fqdn> -> <ip>, <ip> (<secs>s)", colored with ANSI escapes when `color`
std::string format_resolved_text(const Resolved &r, bool color);

// "Scanning Subdomains... [#####     ]  50% 5/10 (2 found)" without newline
std::string format_progress_bar(const Progress &p, int width);

std::string format_summary_text(const ScanReport &report);

// Results file lines (no trailing newline)
std::string format_result_line(const Resolved &r);

std::string build_ndjson_resolved(const Resolved &r);
} // namespace dh
