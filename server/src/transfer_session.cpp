#include "bytebeam/server/transfer_session.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "bytebeam/crypto.hpp"
#include "bytebeam/error_codes.hpp"

namespace bytebeam::server
{

    using protocol::is_terminal;

    TransferSession::TransferSession(SessionIdentity identity, std::string file_name, std::uint64_t file_size,
                                     std::shared_ptr<CacheSlice> slice, Timestamp now)
        : identity_(std::move(identity)),
          slice_(std::move(slice)),
          created_(now),
          file_name_(std::move(file_name)),
          file_size_(file_size),
          accessed_(now)
    {
        if (file_size_ > 0)
        {
            slice_->set_expected_size(file_size_);
        }
    }

    protocol::SessionSnapshot TransferSession::snapshot(bool include_secrets) const
    {
        protocol::SessionSnapshot snapshot{};
        snapshot.path = identity_.path;
        snapshot.reverse = is_reverse();
        snapshot.created = created_;
        if (include_secrets)
        {
            snapshot.upload_key = identity_.upload_key;
            snapshot.download_lock = identity_.download_lock;
        }

        std::lock_guard lock(mutex_);
        snapshot.file_name = file_name_;
        snapshot.file_size = file_size_;
        snapshot.compression = compression_;
        snapshot.upload = upload_;
        snapshot.download = download_;
        snapshot.accessed = accessed_;
        return snapshot;
    }

    void TransferSession::touch(Timestamp now)
    {
        std::lock_guard lock(mutex_);
        if (now > accessed_)
        {
            accessed_ = now;
        }
    }

    TransferSession::Timestamp TransferSession::accessed_at() const
    {
        std::lock_guard lock(mutex_);
        return accessed_;
    }

    bool TransferSession::matches_upload_key(std::string_view key) const
    {
        return crypto::secrets_equal(key, identity_.upload_key);
    }

    std::error_code TransferSession::begin_upload(std::string_view key, std::optional<std::string_view> lock_value)
    {
        if (!matches_upload_key(key))
        {
            return ErrorCode::Unauthorized;
        }
        if (identity_.download_lock && (!lock_value || !crypto::secrets_equal(*lock_value, *identity_.download_lock)))
        {
            return ErrorCode::Locked;
        }

        std::lock_guard lock(mutex_);
        if (protocol::is_terminal(upload_))
        {
            return ErrorCode::AlreadyCompleted;
        }
        if (upload_ == TransferState::InProgress)
        {
            return ErrorCode::AlreadyAttached;
        }
        if (auto ec = slice_->attach_writer())
        {
            if (ec == ErrorCode::Aborted)
            {
                upload_ = TransferState::Failed;
            }
            return ec;
        }
        upload_ = TransferState::InProgress;
        spdlog::debug("[{}] producer attached", identity_.path);
        return {};
    }

    TransferSession::TransferState TransferSession::finish_upload(bool aborted)
    {
        std::lock_guard lock(mutex_);
        const bool clean = slice_->close_writer(aborted);
        if (upload_ == TransferState::InProgress)
        {
            upload_ = clean ? TransferState::Done : TransferState::Failed;
            spdlog::info("[{}] upload {}", identity_.path, protocol::to_string(upload_));
        }
        return upload_;
    }

    std::error_code TransferSession::begin_download()
    {
        std::lock_guard lock(mutex_);
        if (protocol::is_terminal(download_))
        {
            return ErrorCode::AlreadyCompleted;
        }
        if (download_ == TransferState::InProgress)
        {
            return ErrorCode::Locked;
        }
        if (auto ec = slice_->attach_reader())
        {
            if (ec == ErrorCode::Aborted)
            {
                download_ = TransferState::Failed;
            }
            return ec;
        }
        download_ = TransferState::InProgress;
        spdlog::debug("[{}] consumer attached", identity_.path);
        return {};
    }

    TransferSession::TransferState TransferSession::finish_download(bool clean)
    {
        std::lock_guard lock(mutex_);
        slice_->close_reader();
        if (download_ == TransferState::InProgress)
        {
            download_ = clean ? TransferState::Done : TransferState::Failed;
            spdlog::info("[{}] download {}", identity_.path, protocol::to_string(download_));
        }
        return download_;
    }

    void TransferSession::expire()
    {
        std::lock_guard lock(mutex_);
        if (!protocol::is_terminal(upload_))
        {
            upload_ = TransferState::Failed;
        }
        if (!protocol::is_terminal(download_))
        {
            download_ = TransferState::Failed;
        }
        slice_->abort();
    }

    bool TransferSession::is_terminal() const
    {
        std::lock_guard lock(mutex_);
        return protocol::is_terminal(upload_) && protocol::is_terminal(download_);
    }

    TransferSession::TransferState TransferSession::upload_state() const
    {
        std::lock_guard lock(mutex_);
        return upload_;
    }

    TransferSession::TransferState TransferSession::download_state() const
    {
        std::lock_guard lock(mutex_);
        return download_;
    }

    bool TransferSession::set_file_name(std::string name)
    {
        std::lock_guard lock(mutex_);
        if (!file_name_.empty() || name.empty())
        {
            return false;
        }
        file_name_ = std::move(name);
        return true;
    }

    bool TransferSession::set_file_size(std::uint64_t size)
    {
        std::lock_guard lock(mutex_);
        if (upload_ != TransferState::NotStarted)
        {
            return false;
        }
        file_size_ = size;
        slice_->set_expected_size(size);
        return true;
    }

    void TransferSession::set_compression(std::string compression)
    {
        std::lock_guard lock(mutex_);
        compression_ = compression.empty() ? std::string{"none"} : std::move(compression);
    }

    std::string TransferSession::compression() const
    {
        std::lock_guard lock(mutex_);
        return compression_;
    }

} // namespace bytebeam::server
