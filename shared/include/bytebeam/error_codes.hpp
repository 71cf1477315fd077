/**
 * ByteBeam - Relay error taxonomy shared by the engine and the HTTP layer.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace bytebeam
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        NotFound = 1,
        Unauthorized = 2,
        AlreadyAttached = 3,
        Locked = 4,
        AlreadyCompleted = 5,
        Stalled = 6,
        Aborted = 7,
        CapacityExceeded = 8,
        InvalidRequest = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    const std::error_category &relay_category() noexcept;

    std::error_code make_error_code(ErrorCode code) noexcept;

    // Maps any error_code back onto the taxonomy; foreign categories become InternalError.
    ErrorCode to_error_code(const std::error_code &ec) noexcept;

    class RelayError : public std::runtime_error
    {
    public:
        RelayError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace bytebeam

namespace std
{

    template <>
    struct is_error_code_enum<bytebeam::ErrorCode> : true_type
    {
    };

} // namespace std
