#include "bytebeam/server/http_connection.hpp"

#include <boost/beast/http/field.hpp>

#include <chrono>
#include <exception>

#include <spdlog/spdlog.h>

#include "bytebeam/crypto.hpp"
#include "bytebeam/protocol.hpp"
#include "http_common.hpp"

namespace bytebeam::server
{

    namespace http = boost::beast::http;

    void HttpConnection::handle_landing()
    {
        auto response = make_response(http::status::ok);
        response.set(http::field::content_type, "text/plain; charset=utf-8");
        response.body() = std::string(http_common::kLandingText);
        send(std::move(response));
    }

    bool HttpConnection::check_authentication()
    {
        const auto form = encoding::parse_form(form_body_);
        auto it = form.find("authentication");
        if (it == form.end())
        {
            it = target_.query.find("authentication");
            if (it == target_.query.end())
            {
                return false;
            }
        }
        return crypto::secrets_equal(it->second, services_.config.auth_token);
    }

    void HttpConnection::handle_create(const std::string &file_name)
    {
        if (!check_authentication())
        {
            spdlog::warn("Rejected session creation from {}: bad authentication", remote_);
            send_error(ErrorCode::Unauthorized, "Authentication failed");
            return;
        }

        CreateRequest request{};
        request.file_name = file_name;
        if (auto it = target_.query.find("reverse"); it != target_.query.end())
        {
            request.reverse = encoding::is_truthy(it->second);
        }
        const auto form = encoding::parse_form(form_body_);
        if (auto it = form.find("file_size"); it != form.end())
        {
            const auto size = http_common::parse_size(it->second);
            if (!size)
            {
                send_error(ErrorCode::InvalidRequest, "Invalid file_size");
                return;
            }
            request.file_size = *size;
        }

        try
        {
            auto session = services_.registry.create(request, std::chrono::system_clock::now());
            nlohmann::json body = session->snapshot(true);
            send_json(http::status::ok, body);
        }
        catch (const RelayError &error)
        {
            spdlog::error("Session creation failed: {}", error.what());
            send_error(error.code(), error.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Session creation failed: {}", ex.what());
            send_error(ErrorCode::InternalError, ex.what());
        }
    }

    void HttpConnection::handle_lookup(const std::string &path)
    {
        auto session = services_.registry.touch(path, std::chrono::system_clock::now());
        if (!session)
        {
            send_error(ErrorCode::NotFound, "File not found");
            return;
        }

        if (auto it = target_.query.find("status"); it != target_.query.end() && encoding::is_truthy(it->second))
        {
            nlohmann::json body = session->snapshot(false);
            send_json(http::status::ok, body);
            return;
        }

        const auto download = session->download_state();
        if (protocol::is_terminal(download))
        {
            send_error(ErrorCode::AlreadyCompleted, "File already downloaded", session);
            return;
        }
        if (download == protocol::TransferState::InProgress)
        {
            send_error(ErrorCode::Locked, "File being downloaded", session);
            return;
        }

        const auto snapshot = session->snapshot(false);
        const auto &name = snapshot.file_name.empty() ? snapshot.path : snapshot.file_name;
        const auto location = "/" + encoding::url_encode(snapshot.path) + "/" + encoding::url_encode(name);
        spdlog::debug("[{}] redirecting download to {}", path, location);

        auto response = make_response(http::status::found);
        response.set(http::field::location, location);
        send(std::move(response));
    }

    void HttpConnection::handle_delete(const std::string &path)
    {
        if (!check_authentication())
        {
            spdlog::warn("Rejected removal of {} from {}: bad authentication", path, remote_);
            send_error(ErrorCode::Unauthorized, "Authentication failed");
            return;
        }
        if (!services_.registry.remove(path))
        {
            send_error(ErrorCode::NotFound, "File not found");
            return;
        }
        send(make_response(http::status::no_content));
    }

    void HttpConnection::handle_upload_page(const std::shared_ptr<TransferSession> &session)
    {
        const auto snapshot = session->snapshot(true);
        auto response = make_response(http::status::ok);
        response.set(http::field::content_type, "text/html; charset=utf-8");
        response.body() = http_common::upload_page(snapshot.path, snapshot.upload_key.value_or(std::string{}));
        send(std::move(response));
    }

} // namespace bytebeam::server
