#include "bytebeam/server/http_connection.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/write.hpp>

#include <chrono>
#include <cstdint>
#include <string>

#include <spdlog/spdlog.h>

#include "http_common.hpp"

namespace bytebeam::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace net = boost::asio;

    void HttpConnection::start_download(const std::string &path, const std::string &name)
    {
        auto session = services_.registry.touch(path, std::chrono::system_clock::now());
        if (!session)
        {
            send_error(ErrorCode::NotFound, "File not found");
            return;
        }
        if (session->matches_upload_key(name))
        {
            handle_upload_page(session);
            return;
        }
        if (auto ec = session->begin_download())
        {
            send_error(to_error_code(ec), ec.message(), session);
            return;
        }

        download_.path = path;
        download_.active = true;
        const auto snapshot = session->snapshot(false);
        spdlog::info("[{}] download started by {}", path, remote_);

        auto &response = download_.response.emplace(http::status::ok, parser_->get().version());
        response.set(http::field::server, http_common::server_header());
        response.set(http::field::content_type, "application/octet-stream");
        response.set(http::field::content_disposition, http_common::content_disposition(snapshot.file_name));
        response.keep_alive(false);
        if (snapshot.file_size > 0)
        {
            response.content_length(snapshot.file_size);
        }
        else
        {
            response.chunked(true);
            if (snapshot.compression != "none")
            {
                response.set(http::field::content_encoding, snapshot.compression);
            }
        }
        response.body().data = nullptr;
        response.body().more = true;

        download_.serializer.emplace(response);
        expire_after(services_.config.read_stall_timeout);
        http::async_write_header(stream_, *download_.serializer,
                                 beast::bind_front_handler(&HttpConnection::on_download_header, shared_from_this()));
    }

    void HttpConnection::on_download_header(beast::error_code ec, std::size_t /*bytes*/)
    {
        if (ec)
        {
            spdlog::warn("[{}] download header to {} failed: {}", download_.path, remote_, ec.message());
            finish_download(false);
            return;
        }
        watch_disconnect();
        read_next_chunk();
    }

    void HttpConnection::read_next_chunk()
    {
        auto session = services_.registry.touch(download_.path, std::chrono::system_clock::now());
        if (!session)
        {
            spdlog::warn("[{}] session vanished during download", download_.path);
            finish_download(false);
            return;
        }
        session->slice()->async_read(stream_.get_executor(),
                                     [self = shared_from_this()](std::error_code ec, Chunk chunk)
                                     { self->on_chunk_read(ec, std::move(chunk)); });
    }

    void HttpConnection::on_chunk_read(std::error_code ec, Chunk chunk)
    {
        if (!download_.active)
        {
            return;
        }
        if (ec)
        {
            spdlog::warn("[{}] download to {} failed: {}", download_.path, remote_, ec.message());
            finish_download(false);
            return;
        }

        auto &body = download_.response->body();
        if (chunk.empty())
        {
            body.data = nullptr;
            body.size = 0;
            body.more = false;
            expire_after(services_.config.read_stall_timeout);
            http::async_write(stream_, *download_.serializer,
                              beast::bind_front_handler(&HttpConnection::on_last_chunk_sent, shared_from_this()));
            return;
        }

        download_.chunk = std::move(chunk);
        download_.bytes += download_.chunk.size();
        body.data = download_.chunk.data();
        body.size = download_.chunk.size();
        body.more = true;
        expire_after(services_.config.read_stall_timeout);
        http::async_write(stream_, *download_.serializer,
                          beast::bind_front_handler(&HttpConnection::on_chunk_sent, shared_from_this()));
    }

    void HttpConnection::on_chunk_sent(beast::error_code ec, std::size_t /*bytes*/)
    {
        if (ec == http::error::need_buffer)
        {
            ec = {};
        }
        if (!download_.active)
        {
            return;
        }
        if (ec)
        {
            spdlog::warn("[{}] download to {} interrupted: {}", download_.path, remote_, ec.message());
            finish_download(false);
            return;
        }
        read_next_chunk();
    }

    void HttpConnection::on_last_chunk_sent(beast::error_code ec, std::size_t /*bytes*/)
    {
        if (!download_.active)
        {
            return;
        }
        if (ec)
        {
            spdlog::warn("[{}] download to {} interrupted: {}", download_.path, remote_, ec.message());
            finish_download(false);
            return;
        }
        spdlog::info("[{}] download finished: {} bytes to {}", download_.path, download_.bytes, remote_);
        finish_download(true);
    }

    void HttpConnection::watch_disconnect()
    {
        stream_.socket().async_wait(net::ip::tcp::socket::wait_read,
                                    beast::bind_front_handler(&HttpConnection::on_disconnect_watch, shared_from_this()));
    }

    void HttpConnection::on_disconnect_watch(beast::error_code ec)
    {
        if (ec || !download_.active)
        {
            return;
        }
        // A readable socket either carries a pipelined request or reports the
        // peer's FIN. A FIN is handled as a client abort, including a half-close.
        std::uint8_t peek_byte = 0;
        beast::error_code peek_ec;
        auto &socket = stream_.socket();
        socket.non_blocking(true, peek_ec);
        std::size_t peeked = 0;
        if (!peek_ec)
        {
            peeked = socket.receive(net::buffer(&peek_byte, 1), net::socket_base::message_peek, peek_ec);
        }
        beast::error_code restore_ec;
        socket.non_blocking(false, restore_ec);
        if (peek_ec == net::error::would_block || peek_ec == net::error::try_again)
        {
            watch_disconnect();
            return;
        }
        if (peek_ec || peeked == 0)
        {
            spdlog::warn("[{}] downloader {} disconnected: {}", download_.path, remote_,
                         peek_ec ? peek_ec.message() : std::string("end of stream"));
            finish_download(false);
        }
        // Pipelined data is left for after the download; write errors still end the stream.
    }

    void HttpConnection::finish_download(bool clean)
    {
        if (!download_.active)
        {
            return;
        }
        download_.active = false;
        if (auto session = services_.registry.find(download_.path))
        {
            session->finish_download(clean);
        }

        // Also cancels the disconnect watch.
        beast::error_code ec;
        stream_.socket().cancel(ec);
        if (clean)
        {
            stream_.socket().shutdown(net::ip::tcp::socket::shutdown_send, ec);
        }
        else
        {
            stream_.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
            stream_.socket().close(ec);
        }
    }

} // namespace bytebeam::server
