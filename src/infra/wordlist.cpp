#include "dh/wordlist.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <istream>
#include <string_view>

#include <spdlog/spdlog.h>

#include "dh/errors.hpp"

namespace dh {

static std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::vector<std::string> parse_wordlist(std::istream& in)
{
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line))
    {
        std::string_view w = trim(line);
        if (!w.empty()) out.emplace_back(w);
    }
    return out;
}

std::vector<std::string> load_wordlist(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        auto msg = std::format("Wordlist file '{}' not found or unreadable: {}", path, std::strerror(errno));
        spdlog::error("{}", msg);
        throw wordlist_error(msg);
    }
    std::vector<std::string> words = parse_wordlist(in);
    if (in.bad())
    {
        auto msg = std::format("Error reading wordlist file '{}'", path);
        spdlog::error("{}", msg);
        throw wordlist_error(msg);
    }
    spdlog::debug("loaded {} labels from {}", words.size(), path);
    return words;
}

} // namespace dh
