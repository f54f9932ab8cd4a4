#pragma once

#include "ipt/options.hpp"

namespace ipt
{
enum class ParseStatus { Ok, Help, Error };

void print_server_usage(const char *prog);
void print_client_usage(const char *prog);

// --flag value and --flag=value forms. Problems are reported on stderr.
ParseStatus parse_server_args(int argc, char **argv, ServerOptions &opt);
ParseStatus parse_client_args(int argc, char **argv, ClientOptions &opt);
} // namespace ipt
