#pragma once

#include "dh/options.hpp"

namespace dh {

// Installs the spdlog default logger: errors go to opt.log_file, and with
// opt.verbose everything from debug up is mirrored to stderr.
// An unopenable log file is reported on stderr and skipped.
void setup_logging(const Options& opt);

} // namespace dh
