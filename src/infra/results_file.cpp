#include "dh/results_file.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

#include "dh/output.hpp"

namespace dh {

bool save_results(const std::string& path, const std::vector<Resolved>& resolved, bool json)
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out)
    {
        spdlog::error("Error saving results to {}: {}", path, std::strerror(errno));
        return false;
    }
    for (const Resolved& r : resolved)
    {
        out << (json ? build_ndjson_resolved(r) : format_result_line(r)) << '\n';
    }
    out.flush();
    if (!out)
    {
        spdlog::error("Error saving results to {}: write failed", path);
        return false;
    }
    spdlog::debug("saved {} results to {}", resolved.size(), path);
    return true;
}

} // namespace dh
