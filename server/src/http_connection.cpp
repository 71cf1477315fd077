#include "bytebeam/server/http_connection.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/string.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include <utility>

#include <spdlog/spdlog.h>

#include "bytebeam/protocol.hpp"
#include "http_common.hpp"

namespace bytebeam::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;

    namespace
    {

        constexpr std::size_t kFormLimit = 64 * 1024;
        constexpr std::chrono::seconds kRequestTimeout{30};

    } // namespace

    HttpConnection::HttpConnection(net::ip::tcp::socket socket, ServerServices services)
        : stream_(std::move(socket)),
          services_(services),
          delay_timer_(stream_.get_executor())
    {
        remote_ = remote_endpoint();
    }

    HttpConnection::~HttpConnection()
    {
        if (upload_.attached)
        {
            if (auto session = services_.registry.find(upload_.path))
            {
                session->finish_upload(true);
            }
        }
        if (download_.active)
        {
            if (auto session = services_.registry.find(download_.path))
            {
                session->finish_download(false);
            }
        }
        spdlog::debug("Connection from {} closed", remote_);
    }

    void HttpConnection::start()
    {
        net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpConnection::read_header, shared_from_this()));
    }

    void HttpConnection::read_header()
    {
        parser_.emplace();
        parser_->body_limit(boost::none);
        target_ = {};
        form_body_.clear();
        upload_ = UploadState{};
        download_.serializer.reset();
        download_.response.reset();
        download_.path.clear();
        download_.chunk.clear();
        download_.bytes = 0;
        download_.active = false;

        expire_after(kRequestTimeout);
        http::async_read_header(stream_, buffer_, *parser_,
                                beast::bind_front_handler(&HttpConnection::on_read_header, shared_from_this()));
    }

    void HttpConnection::on_read_header(beast::error_code ec, std::size_t /*bytes*/)
    {
        if (ec == http::error::end_of_stream)
        {
            close();
            return;
        }
        if (ec)
        {
            spdlog::debug("Read header from {} failed: {}", remote_, ec.message());
            return;
        }

        const auto &request = parser_->get();
        spdlog::debug("{} {} {}", remote_, std::string(request.method_string()), std::string(request.target()));

        auto target = encoding::parse_target(request.target());
        if (!target)
        {
            send_error(ErrorCode::InvalidRequest, "Malformed request target");
            return;
        }
        target_ = std::move(*target);
        route();
    }

    void HttpConnection::route()
    {
        const auto method = parser_->get().method();
        const auto &segments = target_.segments;

        if (segments.empty())
        {
            if (method == http::verb::get || method == http::verb::head)
            {
                handle_landing();
                return;
            }
        }
        else if (segments.size() == 1)
        {
            const auto name = segments[0];
            switch (method)
            {
            case http::verb::post:
                read_form([this, name]()
                          { handle_create(name); });
                return;
            case http::verb::get:
                handle_lookup(name);
                return;
            case http::verb::delete_:
                read_form([this, name]()
                          { handle_delete(name); });
                return;
            default:
                break;
            }
        }
        else if (segments.size() == 2)
        {
            if (method == http::verb::get)
            {
                start_download(segments[0], segments[1]);
                return;
            }
            if (method == http::verb::post)
            {
                start_upload(segments[0], segments[1]);
                return;
            }
        }
        else
        {
            send_error(ErrorCode::NotFound, "No such route");
            return;
        }
        send_error(ErrorCode::InvalidRequest, "Unsupported method");
    }

    void HttpConnection::read_form(std::function<void()> next)
    {
        if (parser_->is_done())
        {
            next();
            return;
        }
        const auto length = parser_->content_length();
        if (length && *length > kFormLimit)
        {
            send_error(ErrorCode::InvalidRequest, "Form body too large");
            return;
        }
        form_next_ = std::move(next);
        send_continue([this]()
                      { read_form_data(); });
    }

    void HttpConnection::read_form_data()
    {
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        expire_after(kRequestTimeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpConnection::on_form_data, shared_from_this()));
    }

    void HttpConnection::on_form_data(beast::error_code ec, std::size_t /*bytes*/)
    {
        if (ec == http::error::need_buffer)
        {
            ec = {};
        }
        if (ec)
        {
            spdlog::debug("Read body from {} failed: {}", remote_, ec.message());
            form_next_ = nullptr;
            return;
        }
        const auto received = body_buffer_.size() - parser_->get().body().size;
        form_body_.append(reinterpret_cast<const char *>(body_buffer_.data()), received);
        if (form_body_.size() > kFormLimit)
        {
            form_next_ = nullptr;
            send_error(ErrorCode::InvalidRequest, "Form body too large");
            return;
        }
        if (!parser_->is_done())
        {
            read_form_data();
            return;
        }
        auto next = std::move(form_next_);
        form_next_ = nullptr;
        next();
    }

    void HttpConnection::send_continue(std::function<void()> next)
    {
        const auto expect = parser_->get()[http::field::expect];
        if (!beast::iequals(expect, "100-continue"))
        {
            next();
            return;
        }
        auto response = std::make_shared<http::response<http::empty_body>>(http::status::continue_,
                                                                           parser_->get().version());
        expire_after(kRequestTimeout);
        http::async_write(stream_, *response,
                          [self = shared_from_this(), response, next = std::move(next)](beast::error_code ec, std::size_t)
                          {
                              if (ec)
                              {
                                  spdlog::debug("Write 100-continue to {} failed: {}", self->remote_, ec.message());
                                  return;
                              }
                              next();
                          });
    }

    HttpConnection::StringResponse HttpConnection::make_response(http::status status) const
    {
        StringResponse response{status, parser_->get().version()};
        response.set(http::field::server, http_common::server_header());
        return response;
    }

    void HttpConnection::send(StringResponse response)
    {
        // An unread request body cannot be skipped reliably.
        response.keep_alive(parser_->is_done() && parser_->get().keep_alive());
        response.prepare_payload();
        auto shared = std::make_shared<StringResponse>(std::move(response));
        expire_after(kRequestTimeout);
        http::async_write(stream_, *shared,
                          [self = shared_from_this(), shared](beast::error_code ec, std::size_t bytes)
                          { self->on_write(shared->need_eof(), ec, bytes); });
    }

    void HttpConnection::on_write(bool close_after, beast::error_code ec, std::size_t /*bytes*/)
    {
        if (ec)
        {
            spdlog::debug("Write to {} failed: {}", remote_, ec.message());
            return;
        }
        if (close_after)
        {
            close();
            return;
        }
        read_header();
    }

    void HttpConnection::send_json(http::status status, const nlohmann::json &body)
    {
        auto response = make_response(status);
        response.set(http::field::content_type, "application/json");
        response.body() = body.dump();
        send(std::move(response));
    }

    void HttpConnection::send_error(ErrorCode code, std::string message, const std::shared_ptr<TransferSession> &session)
    {
        protocol::ErrorEnvelope envelope{};
        envelope.error = code;
        envelope.message = std::move(message);
        if (session)
        {
            envelope.session = session->snapshot(false);
        }
        spdlog::debug("{} -> {} ({})", remote_, to_string(code), envelope.message);
        nlohmann::json body = envelope;
        send_json(http_common::to_http_status(code), body);
    }

    void HttpConnection::expire_after(std::chrono::seconds timeout)
    {
        if (timeout.count() > 0)
        {
            stream_.expires_after(timeout);
        }
        else
        {
            stream_.expires_never();
        }
    }

    void HttpConnection::close()
    {
        beast::error_code ec;
        stream_.socket().shutdown(net::ip::tcp::socket::shutdown_send, ec);
    }

    std::string HttpConnection::remote_endpoint() const
    {
        beast::error_code ec;
        const auto endpoint = stream_.socket().remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace bytebeam::server
