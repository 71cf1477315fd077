#include "bytebeam/error_codes.hpp"

#include <array>
#include <utility>

namespace bytebeam
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view label;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "Ok", "success"},
            {ErrorCode::NotFound, "NotFound", "unknown path or key"},
            {ErrorCode::Unauthorized, "Unauthorized", "bad secret or key"},
            {ErrorCode::AlreadyAttached, "AlreadyAttached", "producer or consumer slot occupied"},
            {ErrorCode::Locked, "Locked", "transfer is locked"},
            {ErrorCode::AlreadyCompleted, "AlreadyCompleted", "transfer already finished"},
            {ErrorCode::Stalled, "Stalled", "peer stalled past the timeout"},
            {ErrorCode::Aborted, "Aborted", "peer disconnected or size mismatch"},
            {ErrorCode::CapacityExceeded, "CapacityExceeded", "cache capacity is insufficient"},
            {ErrorCode::InvalidRequest, "InvalidRequest", "malformed request"},
            {ErrorCode::InternalError, "InternalError", "internal error"},
        }};

        class RelayCategory : public std::error_category
        {
        public:
            const char *name() const noexcept override
            {
                return "bytebeam.relay";
            }

            std::string message(int value) const override
            {
                const auto code = error_code_from_int(static_cast<std::uint16_t>(value));
                for (const auto &entry : kDescriptions)
                {
                    if (entry.code == code)
                    {
                        return std::string(entry.description);
                    }
                }
                return "unknown";
            }
        };

    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.label;
            }
        }
        return "Unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    const std::error_category &relay_category() noexcept
    {
        static const RelayCategory category;
        return category;
    }

    std::error_code make_error_code(ErrorCode code) noexcept
    {
        return {static_cast<int>(code), relay_category()};
    }

    ErrorCode to_error_code(const std::error_code &ec) noexcept
    {
        if (!ec)
        {
            return ErrorCode::Ok;
        }
        if (ec.category() == relay_category())
        {
            return error_code_from_int(static_cast<std::uint16_t>(ec.value()));
        }
        return ErrorCode::InternalError;
    }

    RelayError::RelayError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code)
    {
    }

} // namespace bytebeam
