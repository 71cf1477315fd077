#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <vector>

namespace bytebeam::server
{

    using Chunk = std::vector<std::uint8_t>;

    class CacheSlice;

    // Process-wide byte budget shared by every slice.
    //
    // A writer may hold at most its fair share (capacity divided by the number of
    // attached writers) unless its slice is empty, and the sum over all slices never
    // exceeds the capacity. Writers that cannot be admitted are parked and retried
    // whenever bytes are released.
    class CachePool
    {
    public:
        explicit CachePool(std::uint64_t capacity);

        CachePool(const CachePool &) = delete;
        CachePool &operator=(const CachePool &) = delete;

        std::uint64_t capacity() const noexcept { return capacity_; }
        std::uint64_t used() const;
        std::uint64_t peak_used() const;
        std::size_t active_writers() const;

    private:
        friend class CacheSlice;

        enum class Admission
        {
            Admitted,
            Wait,
            Never
        };

        Admission try_reserve(const std::weak_ptr<CacheSlice> &slice, std::uint64_t slice_occupied,
                              std::uint64_t bytes);
        void release(std::uint64_t bytes);
        void add_writer();
        void remove_writer();

        mutable std::mutex mutex_;
        const std::uint64_t capacity_;
        std::uint64_t used_{0};
        std::uint64_t peak_{0};
        std::size_t writers_{0};
        std::vector<std::weak_ptr<CacheSlice>> waiters_;
    };

    struct SliceOptions
    {
        // Zero disables the corresponding stall timeout. The read stall only runs
        // while a producer is attached.
        std::chrono::milliseconds write_timeout{0};
        std::chrono::milliseconds read_timeout{0};
    };

    // Bounded FIFO of chunks coupling one producer to one consumer.
    //
    // Completion handlers are always posted to the executor passed with the
    // operation, never invoked inline. At most one write and one read may be
    // outstanding at a time. A read completing without error and with an empty
    // chunk marks the end of the stream.
    class CacheSlice : public std::enable_shared_from_this<CacheSlice>
    {
    public:
        using Executor = boost::asio::any_io_executor;
        using WriteHandler = std::function<void(std::error_code)>;
        using ReadHandler = std::function<void(std::error_code, Chunk)>;

        CacheSlice(CachePool &pool, SliceOptions options);
        ~CacheSlice();

        CacheSlice(const CacheSlice &) = delete;
        CacheSlice &operator=(const CacheSlice &) = delete;

        std::error_code attach_writer();
        std::error_code attach_reader();

        // Zero means unknown. A known size turns short or oversized streams into Aborted.
        void set_expected_size(std::uint64_t bytes);

        void async_write(Chunk chunk, Executor executor, WriteHandler handler);
        void async_read(Executor executor, ReadHandler handler);

        // Returns true when the stream ended cleanly; false when it was (or became) an abort.
        bool close_writer(bool aborted);
        void close_reader();

        // Fails every pending and future operation with Aborted and frees the buffer.
        void abort();

        std::uint64_t occupied() const;
        std::uint64_t bytes_written() const;
        std::uint64_t bytes_read() const;
        bool writer_attached() const;
        bool reader_attached() const;
        bool aborted() const;

    private:
        friend class CachePool;

        struct PendingWrite
        {
            Chunk chunk;
            Executor executor;
            WriteHandler handler;
            std::shared_ptr<boost::asio::steady_timer> timer;
            std::uint64_t id{};
        };

        struct PendingRead
        {
            Executor executor;
            ReadHandler handler;
            std::shared_ptr<boost::asio::steady_timer> timer;
            std::uint64_t id{};
        };

        void on_capacity_available();
        void on_write_timeout(std::uint64_t id);
        void on_read_timeout(std::uint64_t id);

        // The *_locked helpers expect mutex_ to be held and return bytes to hand back
        // to the pool once the lock is dropped.
        std::uint64_t push_locked(Chunk chunk);
        std::uint64_t serve_pending_read_locked();
        std::uint64_t abort_locked(std::error_code reason);
        std::uint64_t discard_buffer_locked();

        std::shared_ptr<boost::asio::steady_timer> arm_timer(const Executor &executor, std::chrono::milliseconds timeout,
                                                             bool for_write, std::uint64_t id);

        static void complete(const Executor &executor, WriteHandler handler, std::error_code ec);
        static void complete(const Executor &executor, ReadHandler handler, std::error_code ec, Chunk chunk);

        CachePool &pool_;
        const SliceOptions options_;

        mutable std::mutex mutex_;
        std::deque<Chunk> fifo_;
        std::uint64_t occupied_{0};
        std::uint64_t bytes_written_{0};
        std::uint64_t bytes_read_{0};
        std::uint64_t expected_size_{0};
        std::uint64_t next_op_id_{0};

        bool writer_attached_{false};
        bool writer_closed_{false};
        bool reader_attached_{false};
        bool reader_closed_{false};
        bool aborted_{false};

        std::optional<PendingWrite> pending_write_;
        std::optional<PendingRead> pending_read_;
    };

} // namespace bytebeam::server
