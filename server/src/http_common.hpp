#pragma once

#include <boost/beast/http/status.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "bytebeam/error_codes.hpp"

namespace bytebeam::server::http_common
{

    inline constexpr std::string_view kLandingText = "If you were sent a link here, it probably doesn't exist anymore.";

    boost::beast::http::status to_http_status(ErrorCode code) noexcept;

    std::string server_header();

    std::string upload_page(std::string_view path, std::string_view key);

    std::string content_disposition(std::string_view file_name);

    std::optional<std::uint64_t> parse_size(std::string_view text);

} // namespace bytebeam::server::http_common
