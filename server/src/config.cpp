#include "bytebeam/server/config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bytebeam/server/token_generator.hpp"

namespace bytebeam::server
{

    namespace
    {

        // Accepts plain bytes or a K/M/G suffix (binary multiples).
        std::uint64_t parse_size(const std::string &text)
        {
            std::size_t consumed = 0;
            const auto value = std::stoull(text, &consumed);
            std::uint64_t multiplier = 1;
            if (consumed < text.size())
            {
                const auto suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(text[consumed])));
                if (suffix == 'K')
                {
                    multiplier = 1ULL << 10;
                }
                else if (suffix == 'M')
                {
                    multiplier = 1ULL << 20;
                }
                else if (suffix == 'G')
                {
                    multiplier = 1ULL << 30;
                }
                else
                {
                    throw std::runtime_error("Invalid size: " + text);
                }
            }
            if (value > std::numeric_limits<std::uint64_t>::max() / multiplier)
            {
                throw std::runtime_error("Size out of range: " + text);
            }
            return value * multiplier;
        }

        std::uint16_t parse_port(const std::string &text)
        {
            const auto value = std::stoul(text);
            if (value > std::numeric_limits<std::uint16_t>::max())
            {
                throw std::runtime_error("Port out of range: " + text);
            }
            return static_cast<std::uint16_t>(value);
        }

        std::string require_value(int &index, int argc, char *argv[], std::string_view flag)
        {
            if (index + 1 >= argc)
            {
                throw std::runtime_error(std::string(flag) + " requires a value");
            }
            ++index;
            return argv[index];
        }

        std::optional<std::string> read_env(const char *name)
        {
            const char *value = std::getenv(name);
            if (value == nullptr || *value == '\0')
            {
                return std::nullopt;
            }
            return std::string(value);
        }

    } // namespace

    void apply_listen(ServerConfig &config, const std::string &listen)
    {
        const auto colon = listen.rfind(':');
        if (colon == std::string::npos)
        {
            throw std::runtime_error("Expected listen format host:port, got " + listen);
        }
        auto host = listen.substr(0, colon);
        if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        {
            host = host.substr(1, host.size() - 2);
        }
        if (!host.empty())
        {
            config.address = host;
        }
        config.port = parse_port(listen.substr(colon + 1));
    }

    void apply_config_file(ServerConfig &config, const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open config file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + ex.what());
        }

        if (auto it = json.find("listen"); it != json.end())
        {
            apply_listen(config, it->get<std::string>());
        }
        config.address = json.value("address", config.address);
        config.port = json.value("port", config.port);
        config.auth_token = json.value("token", config.auth_token);
        config.worker_threads = json.value("threads", config.worker_threads);
        if (auto it = json.find("cache_size"); it != json.end())
        {
            config.cache_capacity = it->is_string() ? parse_size(it->get<std::string>()) : it->get<std::uint64_t>();
        }
        if (auto it = json.find("block_size"); it != json.end())
        {
            config.block_size = static_cast<std::size_t>(
                it->is_string() ? parse_size(it->get<std::string>()) : it->get<std::uint64_t>());
        }
        config.write_stall_timeout = std::chrono::seconds(json.value("write_timeout", config.write_stall_timeout.count()));
        config.read_stall_timeout = std::chrono::seconds(json.value("read_timeout", config.read_stall_timeout.count()));
        config.expiry = std::chrono::seconds(json.value("expiry", config.expiry.count()));
        config.reap_interval = std::chrono::seconds(json.value("reap_interval", config.reap_interval.count()));
        config.completed_retention = std::chrono::seconds(json.value("retention", config.completed_retention.count()));
        config.block_delay = std::chrono::milliseconds(json.value("block_delay_ms", config.block_delay.count()));
        config.path_format = json.value("path_format", config.path_format);
        config.key_format = json.value("key_format", config.key_format);
        if (auto it = json.find("wordlist"); it != json.end())
        {
            config.wordlist = std::filesystem::path(it->get<std::string>());
        }
        if (auto it = json.find("log_file"); it != json.end())
        {
            config.log_file = std::filesystem::path(it->get<std::string>());
        }
        config.log_level = json.value("log_level", config.log_level);
    }

    void apply_environment(ServerConfig &config)
    {
        if (auto token = read_env("BYTEBEAM_TOKEN"))
        {
            config.auth_token = *token;
        }
        if (auto listen = read_env("BYTEBEAM_LISTEN"))
        {
            apply_listen(config, *listen);
        }
        if (auto cache = read_env("BYTEBEAM_CACHE_SIZE"))
        {
            config.cache_capacity = parse_size(*cache);
        }
    }

    CommandLine parse_arguments(int argc, char *argv[])
    {
        CommandLine result;
        auto &config = result.config;

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--config")
            {
                apply_config_file(config, require_value(i, argc, argv, arg));
            }
        }
        apply_environment(config);

        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                result.show_help = true;
            }
            else if (arg == "--config")
            {
                ++i;
            }
            else if (arg == "--listen")
            {
                apply_listen(config, require_value(i, argc, argv, arg));
            }
            else if (arg == "--address")
            {
                config.address = require_value(i, argc, argv, arg);
            }
            else if (arg == "--port")
            {
                config.port = parse_port(require_value(i, argc, argv, arg));
            }
            else if (arg == "--token")
            {
                config.auth_token = require_value(i, argc, argv, arg);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(require_value(i, argc, argv, arg)));
            }
            else if (arg == "--cache-size")
            {
                config.cache_capacity = parse_size(require_value(i, argc, argv, arg));
            }
            else if (arg == "--block-size")
            {
                config.block_size = static_cast<std::size_t>(parse_size(require_value(i, argc, argv, arg)));
            }
            else if (arg == "--write-timeout")
            {
                config.write_stall_timeout = std::chrono::seconds(std::stoll(require_value(i, argc, argv, arg)));
            }
            else if (arg == "--read-timeout")
            {
                config.read_stall_timeout = std::chrono::seconds(std::stoll(require_value(i, argc, argv, arg)));
            }
            else if (arg == "--expiry")
            {
                config.expiry = std::chrono::seconds(std::stoll(require_value(i, argc, argv, arg)));
            }
            else if (arg == "--reap-interval")
            {
                config.reap_interval = std::chrono::seconds(std::stoll(require_value(i, argc, argv, arg)));
            }
            else if (arg == "--retention")
            {
                config.completed_retention = std::chrono::seconds(std::stoll(require_value(i, argc, argv, arg)));
            }
            else if (arg == "--block-delay")
            {
                config.block_delay = std::chrono::milliseconds(std::stoll(require_value(i, argc, argv, arg)));
            }
            else if (arg == "--path-format")
            {
                config.path_format = require_value(i, argc, argv, arg);
            }
            else if (arg == "--key-format")
            {
                config.key_format = require_value(i, argc, argv, arg);
            }
            else if (arg == "--wordlist")
            {
                config.wordlist = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(require_value(i, argc, argv, arg));
            }
            else if (arg == "--log-level")
            {
                config.log_level = require_value(i, argc, argv, arg);
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return result;
    }

    void validate(const ServerConfig &config)
    {
        if (config.port == 0)
        {
            throw std::runtime_error("A listen port is required");
        }
        if (config.auth_token.empty())
        {
            throw std::runtime_error("The authentication token must not be empty");
        }
        if (config.cache_capacity == 0)
        {
            throw std::runtime_error("Cache capacity must be greater than zero");
        }
        if (config.block_size == 0 || config.block_size > config.cache_capacity)
        {
            throw std::runtime_error("Block size must be between 1 byte and the cache capacity");
        }
        if (config.expiry.count() <= 0 || config.reap_interval.count() <= 0)
        {
            throw std::runtime_error("Expiry and reap interval must be positive");
        }
        if (config.write_stall_timeout.count() < 0 || config.read_stall_timeout.count() < 0 ||
            config.completed_retention.count() < 0 || config.block_delay.count() < 0)
        {
            throw std::runtime_error("Timeouts must not be negative");
        }
    }

    std::string usage(const char *program_name)
    {
        std::ostringstream oss;
        oss << "Usage: " << program_name << " [options]\n"
            << "  --listen <HOST:PORT>      listen address (env BYTEBEAM_LISTEN, default 0.0.0.0:3000)\n"
            << "  --address <ADDRESS>       listen host\n"
            << "  --port <PORT>             listen port\n"
            << "  --token <SECRET>          authentication token for creating uploads (env BYTEBEAM_TOKEN)\n"
            << "  --threads <N>             worker threads (default: hardware concurrency)\n"
            << "  --cache-size <BYTES>      global cache capacity, K/M/G suffixes allowed (default 1G)\n"
            << "  --block-size <BYTES>      relay chunk size hint (default 64K)\n"
            << "  --write-timeout <SECS>    producer stall timeout, 0 disables (default 3600)\n"
            << "  --read-timeout <SECS>     consumer stall timeout, 0 disables (default 600)\n"
            << "  --expiry <SECS>           idle session expiry (default 3600)\n"
            << "  --reap-interval <SECS>    reaper interval (default 10)\n"
            << "  --retention <SECS>        how long finished sessions stay visible (default 60)\n"
            << "  --block-delay <MS>        delay between uploaded blocks (default 0)\n"
            << "  --path-format <FORMAT>    download path template ({number}, {word}, {uuid})\n"
            << "  --key-format <FORMAT>     upload key template\n"
            << "  --wordlist <FILE>         word list, one word per line (built-in: " << builtin_wordlist().size()
            << " words, about 10 bits per {word})\n"
            << "  --config <FILE>           JSON configuration file\n"
            << "  --log <FILE>              also log to FILE\n"
            << "  --log-level <LEVEL>       trace, debug, info, warn, error (default info)\n";
        return oss.str();
    }

} // namespace bytebeam::server
