#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace dh {

// One label per line; surrounding whitespace stripped, blank lines dropped.
std::vector<std::string> parse_wordlist(std::istream& in);

// Throws wordlist_error when the file cannot be opened or read.
std::vector<std::string> load_wordlist(const std::string& path);

} // namespace dh
