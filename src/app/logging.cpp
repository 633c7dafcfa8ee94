#include "dh/logging.hpp"

#include <memory>
#include <print>
#include <cstdio>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dh {

void setup_logging(const Options& opt)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (!opt.log_file.empty())
    {
        try {
            auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opt.log_file);
            file->set_level(spdlog::level::err);
            sinks.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& e) {
            std::println(stderr, "cannot open log file {}: {}", opt.log_file, e.what());
        }
    }
    if (opt.verbose)
    {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_level(spdlog::level::debug);
        sinks.push_back(std::move(console));
    }

    auto logger = std::make_shared<spdlog::logger>("domainhunter", sinks.begin(), sinks.end());
    logger->set_level(opt.verbose ? spdlog::level::debug : spdlog::level::err);
    logger->set_pattern("%Y-%m-%d %H:%M:%S,%e - %^%l%$ - %v");
    logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(std::move(logger));
}

} // namespace dh
