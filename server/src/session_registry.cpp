#include "bytebeam/server/session_registry.hpp"

#include <exception>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "bytebeam/error_codes.hpp"

namespace bytebeam::server
{

    namespace
    {

        enum class ReapReason
        {
            Expired,
            Completed
        };

    } // namespace

    SessionRegistry::SessionRegistry(CachePool &pool, const TokenGenerator &tokens, RegistryOptions options)
        : pool_(pool), tokens_(tokens), options_(std::move(options))
    {
        tokens_.validate_format(options_.path_format);
        tokens_.validate_format(options_.key_format);
    }

    SessionRegistry::~SessionRegistry()
    {
        shutdown();
    }

    std::shared_ptr<TransferSession> SessionRegistry::create(const CreateRequest &request, Timestamp now)
    {
        std::lock_guard lock(mutex_);
        SessionIdentity identity{};
        identity.path = generate_unused_locked(options_.path_format);
        identity.upload_key = tokens_.generate(options_.key_format);
        if (request.reverse)
        {
            identity.download_lock = tokens_.generate(options_.key_format);
        }

        auto slice = std::make_shared<CacheSlice>(pool_, options_.slice);
        auto session = std::make_shared<TransferSession>(std::move(identity), request.file_name, request.file_size,
                                                         std::move(slice), now);
        sessions_.emplace(session->path(), session);
        spdlog::info("[{}] session created{} for '{}' ({} bytes)", session->path(), request.reverse ? " (reverse)" : "",
                     request.file_name, request.file_size);
        return session;
    }

    std::shared_ptr<TransferSession> SessionRegistry::find(std::string_view path) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(path);
        if (it == sessions_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    std::shared_ptr<TransferSession> SessionRegistry::touch(std::string_view path, Timestamp now)
    {
        auto session = find(path);
        if (session)
        {
            session->touch(now);
        }
        return session;
    }

    bool SessionRegistry::remove(std::string_view path)
    {
        std::shared_ptr<TransferSession> session;
        {
            std::lock_guard lock(mutex_);
            auto it = sessions_.find(path);
            if (it == sessions_.end())
            {
                return false;
            }
            session = std::move(it->second);
            sessions_.erase(it);
        }
        session->expire();
        spdlog::info("[{}] session removed", session->path());
        return true;
    }

    ReapReport SessionRegistry::reap(Timestamp now)
    {
        std::vector<std::pair<std::shared_ptr<TransferSession>, ReapReason>> candidates;
        {
            std::lock_guard lock(mutex_);
            for (const auto &[path, session] : sessions_)
            {
                const auto idle = now - session->accessed_at();
                if (idle > options_.expiry)
                {
                    candidates.emplace_back(session, ReapReason::Expired);
                }
                else if (session->is_terminal() && idle > options_.completed_retention)
                {
                    candidates.emplace_back(session, ReapReason::Completed);
                }
            }
        }

        ReapReport report{};
        std::vector<std::shared_ptr<TransferSession>> reclaimed;
        reclaimed.reserve(candidates.size());
        for (auto &[session, reason] : candidates)
        {
            try
            {
                session->expire();
                if (reason == ReapReason::Expired)
                {
                    ++report.expired;
                    spdlog::info("[{}] session expired", session->path());
                }
                else
                {
                    ++report.completed;
                    spdlog::debug("[{}] finished session reclaimed", session->path());
                }
                reclaimed.push_back(std::move(session));
            }
            catch (const std::exception &ex)
            {
                // Left in place; the next pass retries it.
                ++report.failed;
                spdlog::error("[{}] failed to reclaim session: {}", session->path(), ex.what());
            }
        }

        std::lock_guard lock(mutex_);
        for (const auto &session : reclaimed)
        {
            auto it = sessions_.find(session->path());
            if (it != sessions_.end() && it->second == session)
            {
                sessions_.erase(it);
            }
        }
        return report;
    }

    std::size_t SessionRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    void SessionRegistry::shutdown()
    {
        std::map<std::string, std::shared_ptr<TransferSession>, std::less<>> sessions;
        {
            std::lock_guard lock(mutex_);
            sessions.swap(sessions_);
        }
        for (const auto &[path, session] : sessions)
        {
            session->expire();
        }
        if (!sessions.empty())
        {
            spdlog::info("Expired {} live sessions on shutdown", sessions.size());
        }
    }

    std::string SessionRegistry::generate_unused_locked(std::string_view format) const
    {
        for (std::size_t attempt = 0; attempt < options_.max_generation_attempts; ++attempt)
        {
            auto candidate = tokens_.generate(format);
            if (!sessions_.contains(candidate))
            {
                return candidate;
            }
        }
        throw RelayError(ErrorCode::InternalError, "Unable to generate an unused session path");
    }

} // namespace bytebeam::server
