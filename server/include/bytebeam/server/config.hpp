#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bytebeam::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{3000};
        std::string auth_token{"password"};
        std::size_t worker_threads{0};

        std::uint64_t cache_capacity{1ULL << 30};
        std::size_t block_size{64 * 1024};
        std::chrono::seconds write_stall_timeout{std::chrono::hours{1}};
        std::chrono::seconds read_stall_timeout{std::chrono::minutes{10}};
        std::chrono::seconds expiry{std::chrono::hours{1}};
        std::chrono::seconds reap_interval{std::chrono::seconds{10}};
        std::chrono::seconds completed_retention{std::chrono::seconds{60}};
        std::chrono::milliseconds block_delay{0};

        std::string path_format{"{number}-{word}-{word}-{word}"};
        std::string key_format{"{number}-{word}-{word}-{word}"};
        std::optional<std::filesystem::path> wordlist;

        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

    struct CommandLine
    {
        ServerConfig config;
        bool show_help{};
    };

    // Defaults, then --config JSON file, then environment, then flags.
    CommandLine parse_arguments(int argc, char *argv[]);

    void apply_config_file(ServerConfig &config, const std::filesystem::path &path);

    void apply_environment(ServerConfig &config);

    // Accepts "host:port", "[v6]:port" or ":port".
    void apply_listen(ServerConfig &config, const std::string &listen);

    void validate(const ServerConfig &config);

    std::string usage(const char *program_name);

} // namespace bytebeam::server
