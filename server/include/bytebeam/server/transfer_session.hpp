#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "bytebeam/protocol.hpp"
#include "bytebeam/server/stream_cache.hpp"

namespace bytebeam::server
{

    struct SessionIdentity
    {
        std::string path;
        std::string upload_key;
        std::optional<std::string> download_lock{};
    };

    // One relay transaction: two monotonic state machines guarding a cache slice.
    //
    // All transitions happen under the session mutex; the slice is only locked
    // after it (session -> slice -> pool).
    class TransferSession
    {
    public:
        using TransferState = protocol::TransferState;
        using Timestamp = protocol::Timestamp;

        TransferSession(SessionIdentity identity, std::string file_name, std::uint64_t file_size,
                        std::shared_ptr<CacheSlice> slice, Timestamp now);

        TransferSession(const TransferSession &) = delete;
        TransferSession &operator=(const TransferSession &) = delete;

        const std::string &path() const noexcept { return identity_.path; }
        bool is_reverse() const noexcept { return identity_.download_lock.has_value(); }

        protocol::SessionSnapshot snapshot(bool include_secrets) const;

        void touch(Timestamp now);
        Timestamp accessed_at() const;

        bool matches_upload_key(std::string_view key) const;

        // Validates the key (and the lock for reverse sessions) and attaches the producer.
        std::error_code begin_upload(std::string_view key, std::optional<std::string_view> lock);
        TransferState finish_upload(bool aborted);

        std::error_code begin_download();
        TransferState finish_download(bool clean);

        // Forces every non-terminal machine to Failed and aborts the slice.
        void expire();

        bool is_terminal() const;
        TransferState upload_state() const;
        TransferState download_state() const;

        // Only fills an empty name.
        bool set_file_name(std::string name);
        // Rejected once the producer has attached.
        bool set_file_size(std::uint64_t size);
        void set_compression(std::string compression);
        std::string compression() const;

        std::shared_ptr<CacheSlice> slice() const { return slice_; }

    private:
        const SessionIdentity identity_;
        const std::shared_ptr<CacheSlice> slice_;
        const Timestamp created_;

        mutable std::mutex mutex_;
        std::string file_name_;
        std::uint64_t file_size_{};
        std::string compression_{"none"};
        TransferState upload_{TransferState::NotStarted};
        TransferState download_{TransferState::NotStarted};
        Timestamp accessed_;
    };

} // namespace bytebeam::server
