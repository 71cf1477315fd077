#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "bytebeam/server/config.hpp"
#include "bytebeam/server/reaper.hpp"
#include "bytebeam/server/session_registry.hpp"
#include "bytebeam/server/stream_cache.hpp"
#include "bytebeam/server/token_generator.hpp"

namespace bytebeam::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        void run();

        // Safe to call from any thread; run() returns once the loop drains.
        void stop();

        std::uint16_t port() const;

        SessionRegistry &registry() noexcept { return registry_; }

    private:
        void accept_next();
        void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
        void shutdown(const std::string &reason);

        ServerConfig config_;
        CachePool pool_;
        TokenGenerator tokens_;
        SessionRegistry registry_;

        // Declared after the registry so pending connections are released first.
        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::signal_set signals_;
        LivenessReaper reaper_;

        std::vector<std::thread> workers_;
    };

} // namespace bytebeam::server
