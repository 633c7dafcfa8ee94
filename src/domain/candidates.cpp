#include "dh/candidates.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "dh/errors.hpp"

namespace dh {

bool is_blank(std::string_view s)
{
    return std::ranges::all_of(s, [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string normalize_domain(std::string_view domain)
{
    auto strip = [](unsigned char c) { return std::isspace(c) != 0 || c == '.'; };
    while (!domain.empty() && strip(static_cast<unsigned char>(domain.front())))
        domain.remove_prefix(1);
    while (!domain.empty() && strip(static_cast<unsigned char>(domain.back())))
        domain.remove_suffix(1);
    return std::string(domain);
}

CandidateGenerator::CandidateGenerator(std::string domain, std::vector<std::string> labels)
    : domain_(normalize_domain(domain)), labels_(std::move(labels))
{
    if (domain_.empty()) throw config_error("base domain must not be empty");
    total_ = static_cast<std::size_t>(std::ranges::count_if(
        labels_, [](const std::string& l) { return !is_blank(l); }));
}

std::optional<Candidate> CandidateGenerator::next()
{
    while (pos_ < labels_.size())
    {
        std::string& label = labels_[pos_++];
        if (is_blank(label)) continue;
        Candidate c;
        c.fqdn.reserve(label.size() + 1 + domain_.size());
        c.fqdn.append(label).append(1, '.').append(domain_);
        c.label = std::move(label);
        return c;
    }
    return std::nullopt;
}

} // namespace dh
