#include <cstdlib>
#include <exception>
#include <iostream>

#include "uplink/client/agent.hpp"
#include "uplink/client/config.hpp"
#include "uplink/client/logger.hpp"
#include "uplink/client/shell.hpp"
#include "uplink/version.hpp"

int main(int argc, char *argv[])
{
    using namespace uplink::client;

    ClientConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        Logger logger(config.log_path, config.verbose);
        logger.log("main", "Uplink client ", uplink::version(), " state in ", config.state_dir.string());

        UploadAgent agent(config, logger);
        agent.start();
        std::cout << "Uplink client " << uplink::version() << " -> " << config.host << ':' << config.port
                  << " (type HELP for commands)" << std::endl;
        {
            Shell shell(agent, std::cin, std::cout, logger);
            shell.run();
        }
        agent.stop();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
