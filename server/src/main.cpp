#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "chunkyard/server/config.hpp"
#include "chunkyard/server/server.hpp"
#include "chunkyard/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char *argv[])
{
    using chunkyard::server::ParseOutcome;
    using chunkyard::server::Server;
    using chunkyard::server::ServerConfig;

    ServerConfig config;
    try
    {
        if (chunkyard::server::parse_arguments(argc, argv, config) == ParseOutcome::ShowHelp)
        {
            std::cout << chunkyard::server::usage(argv[0]);
            return EXIT_SUCCESS;
        }
        chunkyard::server::apply_environment(config.cloud);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << chunkyard::server::usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::from_str(config.log_level));
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting Chunkyard server {} on {}:{}", chunkyard::version(), config.address, config.port);

        std::filesystem::create_directories(config.root);
        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
