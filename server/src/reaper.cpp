#include "bytebeam/server/reaper.hpp"

#include <boost/asio/dispatch.hpp>

#include <exception>

#include <spdlog/spdlog.h>

namespace bytebeam::server
{

    LivenessReaper::LivenessReaper(boost::asio::any_io_executor executor, SessionRegistry &registry,
                                   std::chrono::seconds interval)
        : registry_(registry),
          interval_(interval.count() > 0 ? interval : std::chrono::seconds{1}),
          strand_(boost::asio::make_strand(executor)),
          timer_(strand_)
    {
    }

    void LivenessReaper::start()
    {
        boost::asio::dispatch(strand_, [this]()
                              {
            if (running_)
            {
                return;
            }
            running_ = true;
            spdlog::debug("Reaper running every {}s", interval_.count());
            schedule(); });
    }

    void LivenessReaper::stop()
    {
        boost::asio::dispatch(strand_, [this]()
                              {
            running_ = false;
            timer_.cancel(); });
    }

    ReapReport LivenessReaper::run_once(protocol::Timestamp now)
    {
        try
        {
            auto report = registry_.reap(now);
            if (report.expired > 0 || report.completed > 0 || report.failed > 0)
            {
                spdlog::info("Reaper pass: {} expired, {} finished, {} failed, {} live", report.expired,
                             report.completed, report.failed, registry_.size());
            }
            return report;
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Reaper pass failed: {}", ex.what());
            return {};
        }
    }

    void LivenessReaper::schedule()
    {
        timer_.expires_after(interval_);
        timer_.async_wait([this](const boost::system::error_code &ec)
                          { on_timer(ec); });
    }

    void LivenessReaper::on_timer(const boost::system::error_code &ec)
    {
        if (ec || !running_)
        {
            return;
        }
        run_once(std::chrono::system_clock::now());
        schedule();
    }

} // namespace bytebeam::server
