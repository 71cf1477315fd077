#include "bytebeam/server/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <csignal>
#include <memory>

#include <spdlog/spdlog.h>

#include "bytebeam/server/http_connection.hpp"

namespace bytebeam::server
{

    namespace net = boost::asio;

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::vector<std::string> resolve_wordlist(const ServerConfig &config)
        {
            if (config.wordlist)
            {
                auto words = load_wordlist(*config.wordlist);
                spdlog::info("Loaded {} words from {}", words.size(), config.wordlist->string());
                return words;
            }
            spdlog::debug("Using the built-in wordlist ({} words)", builtin_wordlist().size());
            return builtin_wordlist();
        }

        RegistryOptions make_registry_options(const ServerConfig &config)
        {
            RegistryOptions options{};
            options.expiry = config.expiry;
            options.completed_retention = config.completed_retention;
            options.slice.write_timeout = config.write_stall_timeout;
            options.slice.read_timeout = config.read_stall_timeout;
            options.path_format = config.path_format;
            options.key_format = config.key_format;
            return options;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          pool_(config_.cache_capacity),
          tokens_(resolve_wordlist(config_)),
          registry_(pool_, tokens_, make_registry_options(config_)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          reaper_(io_context_.get_executor(), registry_, config_.reap_interval)
    {
        const auto address = net::ip::make_address(config_.address);
        const net::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with a {} byte cache", config_.address, port(), pool_.capacity());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            shutdown("Signal received, shutting down");
        } });
    }

    Server::~Server()
    {
        // Pending slice completions must be posted while the io_context still exists.
        registry_.shutdown();
    }

    void Server::run()
    {
        accept_next();
        reaper_.start();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
    }

    void Server::stop()
    {
        net::post(io_context_, [this]()
                  { shutdown("Stop requested, shutting down"); });
    }

    std::uint16_t Server::port() const
    {
        boost::system::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(net::make_strand(io_context_),
                               [this](const boost::system::error_code &ec, net::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(boost::system::error_code ec, net::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{registry_, config_};
            auto connection = std::make_shared<HttpConnection>(std::move(socket), services);
            connection->start();
            spdlog::debug("Accepted new connection");
        }
        if (!ec || ec == net::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::shutdown(const std::string &reason)
    {
        spdlog::info("{}", reason);
        boost::system::error_code ec;
        acceptor_.close(ec);
        signals_.cancel(ec);
        reaper_.stop();
        registry_.shutdown();
        io_context_.stop();
    }

} // namespace bytebeam::server
