#pragma once

#include <string>

#include "ipt/options.hpp"

namespace ipt
{
// Installs the "iptest" logger as spdlog's default: colour stderr sink plus
// an append-mode file sink when opt.log_file is set.
// Throws ConfigError for an unknown level or an unopenable log file.
void init_server_logging(const ServerOptions &opt);

// stderr only, warn (debug when verbose).
void init_client_logging(bool verbose);

// IP_TEST_LOG_FILE, else "iptest-server.log".
std::string default_server_log_file();
} // namespace ipt
