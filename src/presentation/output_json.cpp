#include "dh/output.hpp"

#include <format>
#include <sstream>
#include <iomanip>

#include "dh/model.hpp"

namespace dh
{
std::string json_escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (const char c: s)
    {
        switch (c)
        {
            case '"': out += "\\\"";
                break;
            case '\\': out += "\\\\";
                break;
            case '\n': out += "\\n";
                break;
            case '\r': out += "\\r";
                break;
            case '\t': out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                    out += std::format("\\u{:04x}", static_cast<unsigned>(c));
                else
                    out += c;
        }
    }
    return out;
}

std::string build_ndjson_resolved(const Resolved &r)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << R"({"name":")" << json_escape(r.candidate.fqdn)
       << R"(","label":")" << json_escape(r.candidate.label) << R"(")";
    os << R"(,"addresses":[)";
    for (size_t i = 0; i < r.addresses.size(); ++i)
    {
        if (i) os << ',';
        os << '"' << json_escape(r.addresses[i]) << '"';
    }
    os << "]";
    os << ",\"ms\":" << r.ms << ",\"attempts\":" << r.attempts;
    os << "}";
    return os.str();
}
} // namespace dh
