#pragma once

#include <string>
#include <vector>

#include "dh/options.hpp"

namespace dh {

enum class ParseStatus { Ok, Help, Error };

void print_usage(const char *prog);

// Fills `opt` from argv. Problems are reported on stderr and give Error;
// -h/--help prints the usage and gives Help.
ParseStatus parse_args(int argc, char **argv, Options &opt);

// Scan settings for validated options; the wordlist file is read lazily
// by the returned source. The output sink is left for the caller.
ScanConfig make_scan_config(const Options &opt);

// Same, with labels the caller already loaded
ScanConfig make_scan_config(const Options &opt, std::vector<std::string> labels);

ResolverOptions make_resolver_options(const Options &opt);

} // namespace dh
