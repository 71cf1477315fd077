#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "bytebeam/protocol.hpp"
#include "bytebeam/server/stream_cache.hpp"
#include "bytebeam/server/token_generator.hpp"
#include "bytebeam/server/transfer_session.hpp"

namespace bytebeam::server
{

    struct RegistryOptions
    {
        std::chrono::seconds expiry{std::chrono::hours{1}};
        std::chrono::seconds completed_retention{std::chrono::seconds{60}};
        SliceOptions slice{};
        std::size_t max_generation_attempts{16};
        std::string path_format{"{number}-{word}-{word}-{word}"};
        std::string key_format{"{number}-{word}-{word}-{word}"};
    };

    struct CreateRequest
    {
        std::string file_name;
        std::uint64_t file_size{};
        bool reverse{};
    };

    struct ReapReport
    {
        std::size_t expired{};
        std::size_t completed{};
        std::size_t failed{};
    };

    class SessionRegistry
    {
    public:
        using Timestamp = protocol::Timestamp;

        SessionRegistry(CachePool &pool, const TokenGenerator &tokens, RegistryOptions options);
        ~SessionRegistry();

        SessionRegistry(const SessionRegistry &) = delete;
        SessionRegistry &operator=(const SessionRegistry &) = delete;

        // Throws RelayError(InternalError) when no unused path can be generated.
        std::shared_ptr<TransferSession> create(const CreateRequest &request, Timestamp now);

        std::shared_ptr<TransferSession> find(std::string_view path) const;

        // find() that also refreshes the liveness timestamp.
        std::shared_ptr<TransferSession> touch(std::string_view path, Timestamp now);

        // Expires the session (aborting attached streams) and drops it.
        bool remove(std::string_view path);

        ReapReport reap(Timestamp now);

        std::size_t size() const;

        void shutdown();

        CachePool &pool() noexcept { return pool_; }
        const RegistryOptions &options() const noexcept { return options_; }

    private:
        std::string generate_unused_locked(std::string_view format) const;

        CachePool &pool_;
        const TokenGenerator &tokens_;
        const RegistryOptions options_;

        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<TransferSession>, std::less<>> sessions_;
    };

} // namespace bytebeam::server
