#pragma once

#include <stdexcept>
#include <string>

namespace dh {

// Fatal configuration problem detected before a scan starts
class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& what) : std::runtime_error(what) {}
};

class wordlist_error : public std::runtime_error {
public:
    explicit wordlist_error(const std::string& what) : std::runtime_error(what) {}
};

} // namespace dh
