#include "bytebeam/server/http_connection.hpp"

#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>

#include <algorithm>
#include <chrono>
#include <span>

#include <spdlog/spdlog.h>

#include "http_common.hpp"

namespace bytebeam::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;

    namespace
    {

        constexpr std::size_t kFieldLimit = 4 * 1024;

        std::string trim(std::string_view text)
        {
            const auto first = text.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = text.find_last_not_of(" \t\r\n");
            return std::string(text.substr(first, last - first + 1));
        }

    } // namespace

    void HttpConnection::start_upload(const std::string &path, const std::string &key)
    {
        auto session = services_.registry.touch(path, std::chrono::system_clock::now());
        if (!session)
        {
            send_error(ErrorCode::NotFound, "File not found");
            return;
        }
        if (!session->matches_upload_key(key))
        {
            send_error(ErrorCode::Unauthorized, "Invalid upload key");
            return;
        }
        const auto state = session->upload_state();
        if (protocol::is_terminal(state))
        {
            send_error(ErrorCode::AlreadyCompleted, "Upload already finished", session);
            return;
        }
        if (state == protocol::TransferState::InProgress)
        {
            send_error(ErrorCode::AlreadyAttached, "Upload already in progress", session);
            return;
        }

        const auto boundary =
            protocol::MultipartReader::boundary_from_content_type(parser_->get()[http::field::content_type]);
        if (!boundary)
        {
            send_error(ErrorCode::InvalidRequest, "Expected a multipart/form-data body", session);
            return;
        }

        upload_.path = path;
        upload_.key = key;
        if (auto it = target_.query.find("download_lock"); it != target_.query.end())
        {
            upload_.lock = it->second;
        }
        upload_.reader.emplace(*boundary);
        spdlog::debug("[{}] receiving form from {}", path, remote_);
        send_continue([this]()
                      { read_upload_body(); });
    }

    void HttpConnection::read_upload_body()
    {
        if (parser_->is_done())
        {
            fail_upload(ErrorCode::InvalidRequest, "Incomplete form data");
            return;
        }
        parser_->get().body().data = body_buffer_.data();
        parser_->get().body().size = body_buffer_.size();
        expire_after(services_.config.write_stall_timeout);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&HttpConnection::on_upload_body, shared_from_this()));
    }

    void HttpConnection::on_upload_body(beast::error_code ec, std::size_t /*bytes*/)
    {
        if (ec == http::error::need_buffer)
        {
            ec = {};
        }
        if (ec)
        {
            fail_upload(ErrorCode::Aborted, "Upload interrupted: " + ec.message());
            return;
        }
        const auto received = body_buffer_.size() - parser_->get().body().size;
        upload_.reader->feed(std::span<const std::uint8_t>(body_buffer_.data(), received));
        pump_form();
    }

    void HttpConnection::pump_form()
    {
        try
        {
            while (true)
            {
                const auto item = upload_.reader->next();
                switch (item.event)
                {
                case protocol::MultipartEvent::NeedMore:
                    read_upload_body();
                    return;
                case protocol::MultipartEvent::PartBegin:
                    if (!on_part_begin())
                    {
                        return;
                    }
                    break;
                case protocol::MultipartEvent::Data:
                    if (upload_.in_file)
                    {
                        upload_.block.insert(upload_.block.end(), item.data.begin(), item.data.end());
                        upload_.bytes += item.data.size();
                        if (upload_.block.size() >= services_.config.block_size)
                        {
                            write_block();
                            return;
                        }
                    }
                    else if (!upload_.file_done)
                    {
                        if (upload_.field_text.size() + item.data.size() > kFieldLimit)
                        {
                            fail_upload(ErrorCode::InvalidRequest, "Form field too large");
                            return;
                        }
                        upload_.field_text.append(reinterpret_cast<const char *>(item.data.data()), item.data.size());
                    }
                    break;
                case protocol::MultipartEvent::PartEnd:
                    if (!on_part_end())
                    {
                        return;
                    }
                    break;
                case protocol::MultipartEvent::Done:
                {
                    if (!upload_.file_done)
                    {
                        fail_upload(ErrorCode::InvalidRequest, "Form has no file field");
                        return;
                    }
                    auto session = services_.registry.find(upload_.path);
                    if (!session)
                    {
                        send_error(ErrorCode::NotFound, "Session no longer exists");
                        return;
                    }
                    nlohmann::json body = session->snapshot(false);
                    send_json(http::status::ok, body);
                    return;
                }
                }
            }
        }
        catch (const protocol::MultipartError &ex)
        {
            fail_upload(ErrorCode::InvalidRequest, ex.what());
        }
    }

    bool HttpConnection::on_part_begin()
    {
        const auto &part = upload_.reader->part();
        upload_.field = part.name;
        upload_.field_text.clear();
        if (part.name != "file" || upload_.file_done)
        {
            return true;
        }

        auto session = services_.registry.touch(upload_.path, std::chrono::system_clock::now());
        if (!session)
        {
            fail_upload(ErrorCode::NotFound, "File not found");
            return false;
        }
        if (part.filename)
        {
            session->set_file_name(*part.filename);
        }
        std::optional<std::string_view> lock;
        if (upload_.lock)
        {
            lock = *upload_.lock;
        }
        if (auto ec = session->begin_upload(upload_.key, lock))
        {
            fail_upload(to_error_code(ec), ec.message());
            return false;
        }
        upload_.attached = true;
        upload_.in_file = true;
        spdlog::info("[{}] upload started from {}", upload_.path, remote_);
        return true;
    }

    bool HttpConnection::on_part_end()
    {
        if (upload_.in_file)
        {
            upload_.in_file = false;
            upload_.file_ended = true;
            if (!upload_.block.empty())
            {
                write_block();
                return false;
            }
            return complete_file_part();
        }
        if (upload_.file_done)
        {
            return true;
        }

        auto session = services_.registry.find(upload_.path);
        if (!session)
        {
            fail_upload(ErrorCode::NotFound, "File not found");
            return false;
        }
        const auto value = trim(upload_.field_text);
        if (upload_.field == "file-size")
        {
            const auto size = http_common::parse_size(value);
            if (!size)
            {
                fail_upload(ErrorCode::InvalidRequest, "Invalid file-size field");
                return false;
            }
            if (!session->set_file_size(*size))
            {
                spdlog::debug("[{}] file-size after upload start ignored", upload_.path);
            }
        }
        else if (upload_.field == "compression")
        {
            session->set_compression(value);
        }
        else if (upload_.field == "download_lock")
        {
            upload_.lock = value;
        }
        return true;
    }

    void HttpConnection::write_block()
    {
        const auto size = std::min(services_.config.block_size, upload_.block.size());
        const auto split = upload_.block.begin() + static_cast<std::ptrdiff_t>(size);
        Chunk chunk(upload_.block.begin(), split);
        upload_.block.erase(upload_.block.begin(), split);

        auto session = services_.registry.touch(upload_.path, std::chrono::system_clock::now());
        if (!session)
        {
            fail_upload(ErrorCode::Aborted, "Session expired");
            return;
        }
        session->slice()->async_write(std::move(chunk), stream_.get_executor(),
                                      [self = shared_from_this()](std::error_code ec)
                                      { self->on_block_written(ec); });
    }

    void HttpConnection::on_block_written(std::error_code ec)
    {
        if (ec)
        {
            fail_upload(to_error_code(ec), ec.message());
            return;
        }
        const auto delay = services_.config.block_delay;
        if (delay.count() > 0)
        {
            delay_timer_.expires_after(delay);
            delay_timer_.async_wait([self = shared_from_this()](const boost::system::error_code &wait_ec)
                                    {
                if (wait_ec)
                {
                    return;
                }
                self->continue_upload(); });
            return;
        }
        continue_upload();
    }

    void HttpConnection::continue_upload()
    {
        if (upload_.block.size() >= services_.config.block_size || (upload_.file_ended && !upload_.block.empty()))
        {
            write_block();
            return;
        }
        if (upload_.file_ended && !upload_.file_done && !complete_file_part())
        {
            return;
        }
        pump_form();
    }

    bool HttpConnection::complete_file_part()
    {
        auto session = services_.registry.touch(upload_.path, std::chrono::system_clock::now());
        if (!session)
        {
            fail_upload(ErrorCode::Aborted, "Session expired");
            return false;
        }
        upload_.attached = false;
        upload_.file_done = true;
        const auto state = session->finish_upload(false);
        if (state != protocol::TransferState::Done)
        {
            fail_upload(ErrorCode::Aborted, "Upload did not match the declared file size");
            return false;
        }
        spdlog::info("[{}] upload finished: {} bytes from {}", upload_.path, upload_.bytes, remote_);
        return true;
    }

    void HttpConnection::fail_upload(ErrorCode code, std::string message)
    {
        delay_timer_.cancel();
        auto session = services_.registry.find(upload_.path);
        if (upload_.attached)
        {
            upload_.attached = false;
            if (session)
            {
                session->finish_upload(true);
            }
        }
        spdlog::warn("[{}] upload from {} failed: {}", upload_.path, remote_, message);
        send_error(code, std::move(message), session);
    }

} // namespace bytebeam::server
