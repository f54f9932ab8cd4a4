#include "ipt/logging.hpp"

#include <cstdlib>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "ipt/errors.hpp"

namespace ipt
{
static constexpr const char *kPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%l] %v";

std::string default_server_log_file()
{
    const char *v = std::getenv("IP_TEST_LOG_FILE");
    if (v && *v) return v;
    return "iptest-server.log";
}

void init_server_logging(const ServerOptions &opt)
{
    const auto level = spdlog::level::from_str(opt.log_level);
    if (level == spdlog::level::off && opt.log_level != "off")
    {
        throw ConfigError("unknown log level: " + opt.log_level);
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!opt.log_file.empty())
    {
        try
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(opt.log_file));
        }
        catch (const spdlog::spdlog_ex &e)
        {
            throw ConfigError("cannot open log file " + opt.log_file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("iptest", sinks.begin(), sinks.end());
    logger->set_pattern(kPattern);
    logger->set_level(level);
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);
}

void init_client_logging(bool verbose)
{
    auto logger = std::make_shared<spdlog::logger>(
        "iptest", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    logger->set_pattern(kPattern);
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    spdlog::set_default_logger(logger);
}
} // namespace ipt
