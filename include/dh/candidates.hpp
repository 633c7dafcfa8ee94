#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dh/model.hpp"

namespace dh {

// Joins each label with the base domain, lazily and in label order.
// Blank labels are skipped and not counted in total().
// Throws config_error when the domain is empty.
class CandidateGenerator {
public:
    CandidateGenerator(std::string domain, std::vector<std::string> labels);

    std::optional<Candidate> next();

    std::size_t total() const { return total_; }
    const std::string& domain() const { return domain_; }

private:
    std::string              domain_;
    std::vector<std::string> labels_;
    std::size_t              pos_{0};
    std::size_t              total_{0};
};

// "example.com." -> "example.com"; surrounding whitespace and dots removed
std::string normalize_domain(std::string_view domain);

bool is_blank(std::string_view s);

} // namespace dh
