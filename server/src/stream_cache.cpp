#include "bytebeam/server/stream_cache.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "bytebeam/error_codes.hpp"

namespace bytebeam::server
{

    CachePool::CachePool(std::uint64_t capacity)
        : capacity_(capacity)
    {
        if (capacity_ == 0)
        {
            throw std::invalid_argument("Cache capacity must be greater than zero");
        }
    }

    std::uint64_t CachePool::used() const
    {
        std::lock_guard lock(mutex_);
        return used_;
    }

    std::uint64_t CachePool::peak_used() const
    {
        std::lock_guard lock(mutex_);
        return peak_;
    }

    std::size_t CachePool::active_writers() const
    {
        std::lock_guard lock(mutex_);
        return writers_;
    }

    CachePool::Admission CachePool::try_reserve(const std::weak_ptr<CacheSlice> &slice, std::uint64_t slice_occupied,
                                                std::uint64_t bytes)
    {
        std::lock_guard lock(mutex_);
        if (bytes > capacity_)
        {
            return Admission::Never;
        }
        const auto share = capacity_ / std::max<std::size_t>(writers_, 1);
        const bool fits_global = used_ + bytes <= capacity_;
        const bool fits_share = slice_occupied == 0 || slice_occupied + bytes <= share;
        if (fits_global && fits_share)
        {
            used_ += bytes;
            peak_ = std::max(peak_, used_);
            return Admission::Admitted;
        }

        std::erase_if(waiters_, [](const std::weak_ptr<CacheSlice> &weak)
                      { return weak.expired(); });
        const bool queued = std::any_of(waiters_.begin(), waiters_.end(),
                                        [&slice](const std::weak_ptr<CacheSlice> &weak)
                                        { return !weak.owner_before(slice) && !slice.owner_before(weak); });
        if (!queued)
        {
            waiters_.push_back(slice);
        }
        return Admission::Wait;
    }

    void CachePool::release(std::uint64_t bytes)
    {
        std::vector<std::weak_ptr<CacheSlice>> waiters;
        {
            std::lock_guard lock(mutex_);
            used_ -= std::min(bytes, used_);
            waiters.swap(waiters_);
        }
        for (const auto &weak : waiters)
        {
            if (auto slice = weak.lock())
            {
                slice->on_capacity_available();
            }
        }
    }

    void CachePool::add_writer()
    {
        std::lock_guard lock(mutex_);
        ++writers_;
    }

    void CachePool::remove_writer()
    {
        std::lock_guard lock(mutex_);
        if (writers_ > 0)
        {
            --writers_;
        }
    }

    CacheSlice::CacheSlice(CachePool &pool, SliceOptions options)
        : pool_(pool), options_(options)
    {
    }

    CacheSlice::~CacheSlice()
    {
        if (pending_write_)
        {
            complete(pending_write_->executor, std::move(pending_write_->handler), ErrorCode::Aborted);
        }
        if (pending_read_)
        {
            complete(pending_read_->executor, std::move(pending_read_->handler), ErrorCode::Aborted, {});
        }
        if (writer_attached_)
        {
            pool_.remove_writer();
        }
        pool_.release(occupied_);
    }

    std::error_code CacheSlice::attach_writer()
    {
        std::lock_guard lock(mutex_);
        if (aborted_)
        {
            return ErrorCode::Aborted;
        }
        if (writer_attached_)
        {
            return ErrorCode::AlreadyAttached;
        }
        if (writer_closed_)
        {
            return ErrorCode::AlreadyCompleted;
        }
        writer_attached_ = true;
        pool_.add_writer();
        if (pending_read_ && !pending_read_->timer)
        {
            pending_read_->timer = arm_timer(pending_read_->executor, options_.read_timeout, false, pending_read_->id);
        }
        return {};
    }

    std::error_code CacheSlice::attach_reader()
    {
        std::lock_guard lock(mutex_);
        if (aborted_)
        {
            return ErrorCode::Aborted;
        }
        if (reader_attached_)
        {
            return ErrorCode::AlreadyAttached;
        }
        if (reader_closed_)
        {
            return ErrorCode::AlreadyCompleted;
        }
        reader_attached_ = true;
        return {};
    }

    void CacheSlice::set_expected_size(std::uint64_t bytes)
    {
        std::lock_guard lock(mutex_);
        expected_size_ = bytes;
    }

    void CacheSlice::async_write(Chunk chunk, Executor executor, WriteHandler handler)
    {
        std::uint64_t released = 0;
        {
            std::lock_guard lock(mutex_);
            if (aborted_ || reader_closed_)
            {
                complete(executor, std::move(handler), ErrorCode::Aborted);
                return;
            }
            if (!writer_attached_ || pending_write_)
            {
                complete(executor, std::move(handler), ErrorCode::InvalidRequest);
                return;
            }
            if (chunk.empty())
            {
                complete(executor, std::move(handler), {});
                return;
            }
            if (expected_size_ != 0 && bytes_written_ + chunk.size() > expected_size_)
            {
                released = abort_locked(ErrorCode::Aborted);
                complete(executor, std::move(handler), ErrorCode::Aborted);
            }
            else
            {
                switch (pool_.try_reserve(weak_from_this(), occupied_, chunk.size()))
                {
                case CachePool::Admission::Admitted:
                    released = push_locked(std::move(chunk));
                    complete(executor, std::move(handler), {});
                    break;
                case CachePool::Admission::Never:
                    complete(executor, std::move(handler), ErrorCode::CapacityExceeded);
                    break;
                case CachePool::Admission::Wait:
                {
                    const auto id = ++next_op_id_;
                    auto timer = arm_timer(executor, options_.write_timeout, true, id);
                    pending_write_ = PendingWrite{std::move(chunk), std::move(executor), std::move(handler),
                                                  std::move(timer), id};
                    break;
                }
                }
            }
        }
        if (released > 0)
        {
            pool_.release(released);
        }
    }

    void CacheSlice::async_read(Executor executor, ReadHandler handler)
    {
        std::uint64_t released = 0;
        {
            std::lock_guard lock(mutex_);
            if (aborted_)
            {
                complete(executor, std::move(handler), ErrorCode::Aborted, {});
                return;
            }
            if (!reader_attached_ || pending_read_)
            {
                complete(executor, std::move(handler), ErrorCode::InvalidRequest, {});
                return;
            }
            if (!fifo_.empty())
            {
                Chunk chunk = std::move(fifo_.front());
                fifo_.pop_front();
                released = chunk.size();
                occupied_ -= released;
                bytes_read_ += released;
                complete(executor, std::move(handler), {}, std::move(chunk));
            }
            else if (writer_closed_)
            {
                complete(executor, std::move(handler), {}, {});
            }
            else
            {
                const auto id = ++next_op_id_;
                auto timer = writer_attached_ ? arm_timer(executor, options_.read_timeout, false, id) : nullptr;
                pending_read_ = PendingRead{std::move(executor), std::move(handler), std::move(timer), id};
            }
        }
        if (released > 0)
        {
            pool_.release(released);
        }
    }

    bool CacheSlice::close_writer(bool aborted)
    {
        std::uint64_t released = 0;
        bool clean = false;
        {
            std::lock_guard lock(mutex_);
            if (writer_closed_)
            {
                return !aborted_;
            }
            if (writer_attached_)
            {
                writer_attached_ = false;
                pool_.remove_writer();
            }
            writer_closed_ = true;

            if (expected_size_ != 0 && bytes_written_ != expected_size_)
            {
                aborted = true;
            }
            if (pending_write_)
            {
                auto pending = std::move(*pending_write_);
                pending_write_.reset();
                complete(pending.executor, std::move(pending.handler), ErrorCode::Aborted);
            }
            if (aborted || aborted_)
            {
                released = abort_locked(ErrorCode::Aborted);
            }
            else
            {
                clean = true;
                released = serve_pending_read_locked();
                if (reader_closed_)
                {
                    released += discard_buffer_locked();
                }
            }
        }
        // Always notify: a detached writer enlarges everyone else's fair share.
        pool_.release(released);
        return clean;
    }

    void CacheSlice::close_reader()
    {
        std::uint64_t released = 0;
        {
            std::lock_guard lock(mutex_);
            if (reader_closed_)
            {
                return;
            }
            reader_attached_ = false;
            reader_closed_ = true;
            if (pending_read_)
            {
                auto pending = std::move(*pending_read_);
                pending_read_.reset();
                complete(pending.executor, std::move(pending.handler), ErrorCode::Aborted, {});
            }
            if (pending_write_)
            {
                auto pending = std::move(*pending_write_);
                pending_write_.reset();
                complete(pending.executor, std::move(pending.handler), ErrorCode::Aborted);
            }
            released = discard_buffer_locked();
        }
        if (released > 0)
        {
            pool_.release(released);
        }
    }

    void CacheSlice::abort()
    {
        std::uint64_t released = 0;
        {
            std::lock_guard lock(mutex_);
            released = abort_locked(ErrorCode::Aborted);
            if (writer_attached_)
            {
                writer_attached_ = false;
                pool_.remove_writer();
            }
            writer_closed_ = true;
            reader_attached_ = false;
            reader_closed_ = true;
        }
        pool_.release(released);
    }

    std::uint64_t CacheSlice::occupied() const
    {
        std::lock_guard lock(mutex_);
        return occupied_;
    }

    std::uint64_t CacheSlice::bytes_written() const
    {
        std::lock_guard lock(mutex_);
        return bytes_written_;
    }

    std::uint64_t CacheSlice::bytes_read() const
    {
        std::lock_guard lock(mutex_);
        return bytes_read_;
    }

    bool CacheSlice::writer_attached() const
    {
        std::lock_guard lock(mutex_);
        return writer_attached_;
    }

    bool CacheSlice::reader_attached() const
    {
        std::lock_guard lock(mutex_);
        return reader_attached_;
    }

    bool CacheSlice::aborted() const
    {
        std::lock_guard lock(mutex_);
        return aborted_;
    }

    void CacheSlice::on_capacity_available()
    {
        std::uint64_t released = 0;
        {
            std::lock_guard lock(mutex_);
            if (!pending_write_)
            {
                return;
            }
            if (aborted_ || reader_closed_)
            {
                auto pending = std::move(*pending_write_);
                pending_write_.reset();
                complete(pending.executor, std::move(pending.handler), ErrorCode::Aborted);
                return;
            }
            switch (pool_.try_reserve(weak_from_this(), occupied_, pending_write_->chunk.size()))
            {
            case CachePool::Admission::Admitted:
            {
                auto pending = std::move(*pending_write_);
                pending_write_.reset();
                released = push_locked(std::move(pending.chunk));
                complete(pending.executor, std::move(pending.handler), {});
                break;
            }
            case CachePool::Admission::Never:
            {
                auto pending = std::move(*pending_write_);
                pending_write_.reset();
                complete(pending.executor, std::move(pending.handler), ErrorCode::CapacityExceeded);
                break;
            }
            case CachePool::Admission::Wait:
                break;
            }
        }
        if (released > 0)
        {
            pool_.release(released);
        }
    }

    void CacheSlice::on_write_timeout(std::uint64_t id)
    {
        std::lock_guard lock(mutex_);
        if (!pending_write_ || pending_write_->id != id)
        {
            return;
        }
        auto pending = std::move(*pending_write_);
        pending_write_.reset();
        complete(pending.executor, std::move(pending.handler), ErrorCode::Stalled);
    }

    void CacheSlice::on_read_timeout(std::uint64_t id)
    {
        std::lock_guard lock(mutex_);
        if (!pending_read_ || pending_read_->id != id)
        {
            return;
        }
        auto pending = std::move(*pending_read_);
        pending_read_.reset();
        complete(pending.executor, std::move(pending.handler), ErrorCode::Stalled, {});
    }

    std::uint64_t CacheSlice::push_locked(Chunk chunk)
    {
        occupied_ += chunk.size();
        bytes_written_ += chunk.size();
        fifo_.push_back(std::move(chunk));
        return serve_pending_read_locked();
    }

    std::uint64_t CacheSlice::serve_pending_read_locked()
    {
        if (!pending_read_)
        {
            return 0;
        }
        if (!fifo_.empty())
        {
            auto pending = std::move(*pending_read_);
            pending_read_.reset();
            Chunk chunk = std::move(fifo_.front());
            fifo_.pop_front();
            const auto size = static_cast<std::uint64_t>(chunk.size());
            occupied_ -= size;
            bytes_read_ += size;
            complete(pending.executor, std::move(pending.handler), {}, std::move(chunk));
            return size;
        }
        if (writer_closed_)
        {
            auto pending = std::move(*pending_read_);
            pending_read_.reset();
            complete(pending.executor, std::move(pending.handler), {}, {});
        }
        return 0;
    }

    std::uint64_t CacheSlice::abort_locked(std::error_code reason)
    {
        aborted_ = true;
        if (pending_write_)
        {
            auto pending = std::move(*pending_write_);
            pending_write_.reset();
            complete(pending.executor, std::move(pending.handler), reason);
        }
        if (pending_read_)
        {
            auto pending = std::move(*pending_read_);
            pending_read_.reset();
            complete(pending.executor, std::move(pending.handler), reason, {});
        }
        return discard_buffer_locked();
    }

    std::uint64_t CacheSlice::discard_buffer_locked()
    {
        const auto released = occupied_;
        fifo_.clear();
        occupied_ = 0;
        return released;
    }

    std::shared_ptr<boost::asio::steady_timer> CacheSlice::arm_timer(const Executor &executor,
                                                                     std::chrono::milliseconds timeout, bool for_write,
                                                                     std::uint64_t id)
    {
        if (timeout.count() <= 0)
        {
            return nullptr;
        }
        auto timer = std::make_shared<boost::asio::steady_timer>(executor, timeout);
        timer->async_wait([weak = weak_from_this(), for_write, id](const boost::system::error_code &ec)
                          {
            if (ec)
            {
                return;
            }
            if (auto self = weak.lock())
            {
                if (for_write)
                {
                    self->on_write_timeout(id);
                }
                else
                {
                    self->on_read_timeout(id);
                }
            } });
        return timer;
    }

    void CacheSlice::complete(const Executor &executor, WriteHandler handler, std::error_code ec)
    {
        boost::asio::post(executor, [handler = std::move(handler), ec]()
                          { handler(ec); });
    }

    void CacheSlice::complete(const Executor &executor, ReadHandler handler, std::error_code ec, Chunk chunk)
    {
        boost::asio::post(executor, [handler = std::move(handler), ec, chunk = std::move(chunk)]() mutable
                          { handler(ec, std::move(chunk)); });
    }

} // namespace bytebeam::server
