#include <cstdlib>
#include <iostream>
#include <utility>

#include "coursesync/client/config.hpp"
#include "coursesync/client/curl_transport.hpp"
#include "coursesync/client/logger.hpp"
#include "coursesync/client/prompt.hpp"
#include "coursesync/client/session.hpp"
#include "coursesync/errors.hpp"
#include "coursesync/version.hpp"

int main(int argc, char *argv[])
{
    using namespace coursesync::client;

    try
    {
        auto config = parse_arguments(argc, argv);
        if (config.show_help)
        {
            std::cout << "coursesync " << coursesync::version() << "\n" << usage_text();
            return EXIT_SUCCESS;
        }

        if (config.kind != SyncKind::Verify)
        {
            load_credentials(config);
        }

        Logger logger(LoggerOptions{.console = true, .verbose = config.verbose, .file = config.log_path});
        CurlTransport transport(CurlTransportOptions{.token = config.token});
        Prompt prompt(std::cin, std::cout);
        SyncSession session(std::move(config), logger, transport, prompt);
        return session.run();
    }
    catch (const coursesync::Error &ex)
    {
        std::cerr << "ERROR: " << coursesync::to_string(ex.code()) << std::endl;
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        std::cerr << usage_text();
        return EXIT_FAILURE;
    }
}
