#include <iostream>

#include "ipt/cli.hpp"
#include "ipt/client.hpp"
#include "ipt/http_client.hpp"
#include "ipt/logging.hpp"

int main(int argc, char **argv)
{
    ipt::ClientOptions opt;
    switch (ipt::parse_client_args(argc, argv, opt))
    {
        case ipt::ParseStatus::Ok: break;
        case ipt::ParseStatus::Help: return 0;
        case ipt::ParseStatus::Error: return ipt::exit_code::usage;
    }
    ipt::init_client_logging(opt.verbose);

    const ipt::EnvLookup env = ipt::process_env();
    const std::string config_path =
        ipt::client_config_path(opt, env, ipt::executable_dir(argv[0]));
    const ipt::ServerEndpoint endpoint = ipt::resolve_endpoint(env, config_path);

    ipt::BeastTransport transport(endpoint);
    return ipt::run_client(opt, endpoint, transport, std::cout, std::cerr);
}
