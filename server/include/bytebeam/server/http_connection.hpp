#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/serializer.hpp>
#include <boost/beast/http/string_body.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "bytebeam/encoding/url.hpp"
#include "bytebeam/error_codes.hpp"
#include "bytebeam/multipart.hpp"
#include "bytebeam/server/config.hpp"
#include "bytebeam/server/session_registry.hpp"

namespace bytebeam::server
{

    struct ServerServices
    {
        SessionRegistry &registry;
        const ServerConfig &config;
    };

    // One HTTP/1.1 connection. Requests are served one at a time; uploads and
    // downloads stream their bodies through the session's cache slice.
    class HttpConnection : public std::enable_shared_from_this<HttpConnection>
    {
    public:
        HttpConnection(boost::asio::ip::tcp::socket socket, ServerServices services);
        ~HttpConnection();

        void start();

    private:
        using StringResponse = boost::beast::http::response<boost::beast::http::string_body>;
        using StreamResponse = boost::beast::http::response<boost::beast::http::buffer_body>;

        // Request loop (http_connection.cpp)
        void read_header();
        void on_read_header(boost::beast::error_code ec, std::size_t bytes);
        void route();
        void read_form(std::function<void()> next);
        void read_form_data();
        void on_form_data(boost::beast::error_code ec, std::size_t bytes);
        void send_continue(std::function<void()> next);
        void send(StringResponse response);
        void on_write(bool close, boost::beast::error_code ec, std::size_t bytes);
        void send_json(boost::beast::http::status status, const nlohmann::json &body);
        void send_error(ErrorCode code, std::string message, const std::shared_ptr<TransferSession> &session = nullptr);
        StringResponse make_response(boost::beast::http::status status) const;
        // Zero disables the timeout for the next socket operation.
        void expire_after(std::chrono::seconds timeout);
        void close();

        // Session management routes (http_connection_routes.cpp)
        void handle_landing();
        void handle_create(const std::string &file_name);
        void handle_lookup(const std::string &path);
        void handle_delete(const std::string &path);
        void handle_upload_page(const std::shared_ptr<TransferSession> &session);
        bool check_authentication();

        // Upload pipeline (http_connection_upload.cpp)
        void start_upload(const std::string &path, const std::string &key);
        void read_upload_body();
        void on_upload_body(boost::beast::error_code ec, std::size_t bytes);
        void pump_form();
        bool on_part_begin();
        bool on_part_end();
        void write_block();
        void on_block_written(std::error_code ec);
        void continue_upload();
        bool complete_file_part();
        void fail_upload(ErrorCode code, std::string message);

        // Download pipeline (http_connection_download.cpp)
        void start_download(const std::string &path, const std::string &name);
        void on_download_header(boost::beast::error_code ec, std::size_t bytes);
        void read_next_chunk();
        void on_chunk_read(std::error_code ec, Chunk chunk);
        void on_chunk_sent(boost::beast::error_code ec, std::size_t bytes);
        void on_last_chunk_sent(boost::beast::error_code ec, std::size_t bytes);
        void watch_disconnect();
        void on_disconnect_watch(boost::beast::error_code ec);
        void finish_download(bool clean);

        std::string remote_endpoint() const;

        struct UploadState
        {
            std::string path;
            std::string key;
            std::optional<std::string> lock;
            std::optional<protocol::MultipartReader> reader;
            std::string field;
            std::string field_text;
            Chunk block;
            std::uint64_t bytes{};
            bool in_file{false};
            bool file_ended{false};
            bool file_done{false};
            bool attached{false};
        };

        struct DownloadState
        {
            std::string path;
            std::optional<StreamResponse> response;
            std::optional<boost::beast::http::response_serializer<boost::beast::http::buffer_body>> serializer;
            Chunk chunk;
            std::uint64_t bytes{};
            bool active{false};
        };

        boost::beast::tcp_stream stream_;
        ServerServices services_;
        std::string remote_;

        boost::beast::flat_buffer buffer_;
        std::optional<boost::beast::http::request_parser<boost::beast::http::buffer_body>> parser_;
        std::array<std::uint8_t, 16 * 1024> body_buffer_{};
        encoding::Target target_;
        std::string form_body_;
        std::function<void()> form_next_;

        boost::asio::steady_timer delay_timer_;
        UploadState upload_;
        DownloadState download_;
    };

} // namespace bytebeam::server
