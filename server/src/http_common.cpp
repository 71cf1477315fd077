#include "http_common.hpp"

#include <charconv>

#include "bytebeam/encoding/url.hpp"
#include "bytebeam/version.hpp"

namespace bytebeam::server::http_common
{

    namespace http = boost::beast::http;

    namespace
    {

        std::string escape_html(std::string_view text)
        {
            std::string escaped;
            escaped.reserve(text.size());
            for (const char c : text)
            {
                switch (c)
                {
                case '&':
                    escaped += "&amp;";
                    break;
                case '<':
                    escaped += "&lt;";
                    break;
                case '>':
                    escaped += "&gt;";
                    break;
                case '"':
                    escaped += "&quot;";
                    break;
                default:
                    escaped += c;
                }
            }
            return escaped;
        }

    } // namespace

    http::status to_http_status(ErrorCode code) noexcept
    {
        switch (code)
        {
        case ErrorCode::Ok:
            return http::status::ok;
        case ErrorCode::NotFound:
            return http::status::not_found;
        case ErrorCode::Unauthorized:
            return http::status::unauthorized;
        case ErrorCode::AlreadyAttached:
        case ErrorCode::Locked:
            return http::status::conflict;
        case ErrorCode::AlreadyCompleted:
        case ErrorCode::Aborted:
            return http::status::gone;
        case ErrorCode::Stalled:
            return http::status::gateway_timeout;
        case ErrorCode::CapacityExceeded:
            return http::status::insufficient_storage;
        case ErrorCode::InvalidRequest:
            return http::status::bad_request;
        case ErrorCode::InternalError:
            break;
        }
        return http::status::internal_server_error;
    }

    std::string server_header()
    {
        return "ByteBeam/" + std::string(version());
    }

    std::string upload_page(std::string_view path, std::string_view key)
    {
        const auto action = escape_html("/" + encoding::url_encode(path) + "/" + encoding::url_encode(key));
        std::string page;
        page += "<!DOCTYPE html>\n<html>\n<head>\n";
        page += "<meta charset=\"utf-8\">\n";
        page += "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n";
        page += "<title>ByteBeam File Upload</title>\n";
        page += "</head>\n<body>\n";
        page += "<h1>ByteBeam File Upload</h1>\n";
        page += "<p>You can only begin an upload once, if the upload fails you will need to ask for a new upload "
                "link</p>\n";
        page += "<form method=\"POST\" action=\"" + action + "\" enctype=\"multipart/form-data\">\n";
        page += "<input name=\"file\" type=\"file\">\n";
        page += "<input type=\"submit\" value=\"Upload\">\n";
        page += "</form>\n";
        page += "<p>You can also upload the file using curl</p>\n";
        page += "<tt>curl -F 'file=@/path/to/file' http://this-url" + action + "</tt>\n";
        page += "</body>\n</html>\n";
        return page;
    }

    std::string content_disposition(std::string_view file_name)
    {
        if (file_name.empty())
        {
            return "attachment";
        }
        std::string ascii;
        for (const char c : file_name)
        {
            const auto byte = static_cast<unsigned char>(c);
            ascii += (byte < 0x20 || byte >= 0x7f || c == '"' || c == '\\') ? '_' : c;
        }
        return "attachment; filename=\"" + ascii + "\"; filename*=UTF-8''" + encoding::url_encode(file_name);
    }

    std::optional<std::uint64_t> parse_size(std::string_view text)
    {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        {
            text.remove_prefix(1);
        }
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r' || text.back() == '\n'))
        {
            text.remove_suffix(1);
        }
        std::uint64_t value{};
        const auto *end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (text.empty() || ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        return value;
    }

} // namespace bytebeam::server::http_common
