#include <iostream>
#include <string>

#include "skydrive/client/config.hpp"
#include "skydrive/client/logger.hpp"
#include "skydrive/client/session.hpp"
#include "skydrive/version.hpp"

int main(int argc, char *argv[])
{
    using namespace skydrive::client;

    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-V"))
    {
        std::cout << "skydrive " << skydrive::version() << std::endl;
        return 0;
    }
    if (argc == 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h"))
    {
        std::cout << usage();
        return 0;
    }

    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path);
        logger.log("info", "skydrive ", skydrive::version(), " starting");
        ClientSession session(config, std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
