/**
 * ByteBeam - Session status model and JSON serialization helpers.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bytebeam/error_codes.hpp"

namespace bytebeam::protocol
{

    enum class TransferState : std::uint8_t
    {
        NotStarted,
        InProgress,
        Done,
        Failed
    };

    std::string_view to_string(TransferState state) noexcept;
    std::optional<TransferState> transfer_state_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(TransferState state) noexcept
    {
        return state == TransferState::Done || state == TransferState::Failed;
    }

    using Timestamp = std::chrono::system_clock::time_point;

    // RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T12:00:00.250Z
    std::string format_timestamp(Timestamp time);
    Timestamp parse_timestamp(std::string_view text);

    struct SessionSnapshot
    {
        std::string file_name;
        std::uint64_t file_size{};
        std::string path;
        std::optional<std::string> upload_key{};
        std::optional<std::string> download_lock{};
        TransferState upload{TransferState::NotStarted};
        TransferState download{TransferState::NotStarted};
        Timestamp created{};
        Timestamp accessed{};
        bool reverse{};
        std::string compression{"none"};
    };

    // Copy with every secret removed; safe for status polling.
    SessionSnapshot redact(SessionSnapshot snapshot);

    // "/path/key", carrying the download lock as a query parameter for reverse sessions.
    std::string upload_url(const SessionSnapshot &snapshot);
    std::string download_url(const SessionSnapshot &snapshot);

    void to_json(nlohmann::json &json, const SessionSnapshot &snapshot);
    void from_json(const nlohmann::json &json, SessionSnapshot &snapshot);

    struct ErrorEnvelope
    {
        ErrorCode error{ErrorCode::InternalError};
        std::string message{};
        std::optional<SessionSnapshot> session{};
    };

    void to_json(nlohmann::json &json, const ErrorEnvelope &envelope);
    void from_json(const nlohmann::json &json, ErrorEnvelope &envelope);

} // namespace bytebeam::protocol
