#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>

#include "bytebeam/server/session_registry.hpp"

namespace bytebeam::server
{

    // Periodically reclaims idle and finished sessions from the registry.
    class LivenessReaper
    {
    public:
        LivenessReaper(boost::asio::any_io_executor executor, SessionRegistry &registry, std::chrono::seconds interval);

        LivenessReaper(const LivenessReaper &) = delete;
        LivenessReaper &operator=(const LivenessReaper &) = delete;

        void start();
        void stop();

        // One pass; never throws.
        ReapReport run_once(protocol::Timestamp now);

    private:
        void schedule();
        void on_timer(const boost::system::error_code &ec);

        SessionRegistry &registry_;
        const std::chrono::seconds interval_;
        boost::asio::strand<boost::asio::any_io_executor> strand_;
        boost::asio::steady_timer timer_;
        bool running_{false};
    };

} // namespace bytebeam::server
