#pragma once

#include <string>
#include <vector>

#include "dh/model.hpp"

namespace dh {

// Writes one line per resolved entry (text or NDJSON). On I/O failure logs
// the error and returns false; the scan result itself stays valid.
bool save_results(const std::string& path, const std::vector<Resolved>& resolved, bool json);

} // namespace dh
