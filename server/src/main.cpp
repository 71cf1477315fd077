#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <vector>

#include "bytebeam/server/config.hpp"
#include "bytebeam/server/server.hpp"
#include "bytebeam/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "ByteBeam server " << bytebeam::version() << "\n"
                  << bytebeam::server::usage(program_name);
    }

    void configure_logging(const bytebeam::server::ServerConfig &config)
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
    }

} // namespace

int main(int argc, char *argv[])
{
    using bytebeam::server::Server;

    bytebeam::server::CommandLine command_line;
    try
    {
        command_line = bytebeam::server::parse_arguments(argc, argv);
        if (command_line.show_help)
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        bytebeam::server::validate(command_line.config);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    auto &config = command_line.config;
    try
    {
        configure_logging(config);
        spdlog::info("Starting ByteBeam server {} on {}:{}", bytebeam::version(), config.address, config.port);
        if (config.auth_token == "password")
        {
            spdlog::warn("Using the default authentication token; set --token or BYTEBEAM_TOKEN");
        }

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
