#include <exception>
#include <iostream>

#include "formupload/client/cli_session.hpp"
#include "formupload/client/config.hpp"
#include "formupload/client/logger.hpp"

int main(int argc, char *argv[])
{
    try
    {
        auto config = formupload::client::parse_arguments(argc, argv);
        formupload::client::Logger logger(config.log_path);
        formupload::client::CliSession session(std::move(config), std::move(logger));
        return session.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
