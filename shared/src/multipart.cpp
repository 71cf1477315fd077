#include "bytebeam/multipart.hpp"

#include <algorithm>
#include <cctype>

namespace bytebeam::protocol
{

    namespace
    {
        constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
        constexpr std::size_t kMaxBoundaryLength = 70;

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        // Finds `key=value` or `key="value"` among the `;`-separated parameters.
        std::optional<std::string> header_parameter(std::string_view header, std::string_view key)
        {
            std::size_t cursor = header.find(';');
            while (cursor != std::string_view::npos)
            {
                auto rest = trim(header.substr(cursor + 1));
                const auto eq = rest.find('=');
                if (eq == std::string_view::npos)
                {
                    return std::nullopt;
                }
                const auto name = to_lower(trim(rest.substr(0, eq)));
                rest = trim(rest.substr(eq + 1));
                std::string value;
                std::size_t consumed = 0;
                if (!rest.empty() && rest.front() == '"')
                {
                    std::size_t i = 1;
                    for (; i < rest.size() && rest[i] != '"'; ++i)
                    {
                        if (rest[i] == '\\' && i + 1 < rest.size())
                        {
                            ++i;
                        }
                        value.push_back(rest[i]);
                    }
                    consumed = std::min(i + 1, rest.size());
                }
                else
                {
                    consumed = std::min(rest.find(';'), rest.size());
                    value = std::string(trim(rest.substr(0, consumed)));
                }
                if (name == key)
                {
                    return value;
                }
                const auto next = rest.substr(consumed).find(';');
                if (next == std::string_view::npos)
                {
                    return std::nullopt;
                }
                header = rest.substr(consumed + next);
                cursor = 0;
            }
            return std::nullopt;
        }

    } // namespace

    MultipartReader::MultipartReader(std::string_view boundary)
        : delimiter_("\r\n--" + std::string(boundary)), buffer_("\r\n")
    {
        if (boundary.empty() || boundary.size() > kMaxBoundaryLength)
        {
            throw MultipartError("Invalid multipart boundary");
        }
    }

    std::optional<std::string> MultipartReader::boundary_from_content_type(std::string_view content_type)
    {
        const auto media = to_lower(trim(content_type.substr(0, content_type.find(';'))));
        if (media != "multipart/form-data")
        {
            return std::nullopt;
        }
        auto boundary = header_parameter(content_type, "boundary");
        if (!boundary || boundary->empty() || boundary->size() > kMaxBoundaryLength)
        {
            return std::nullopt;
        }
        return boundary;
    }

    void MultipartReader::feed(std::span<const std::uint8_t> bytes)
    {
        if (state_ == State::Done)
        {
            return;
        }
        if (pos_ > 0)
        {
            buffer_.erase(0, pos_);
            pos_ = 0;
        }
        buffer_.append(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    }

    MultipartItem MultipartReader::next()
    {
        while (true)
        {
            switch (state_)
            {
            case State::Preamble:
            {
                const auto found = buffer_.find(delimiter_, pos_);
                if (found == std::string::npos)
                {
                    const auto keep = delimiter_.size() - 1;
                    pos_ = std::max(pos_, buffer_.size() > keep ? buffer_.size() - keep : 0);
                    return {};
                }
                pos_ = found + delimiter_.size();
                state_ = State::AfterDelimiter;
                break;
            }
            case State::AfterDelimiter:
            {
                if (buffer_.size() - pos_ < 2)
                {
                    return {};
                }
                if (buffer_.compare(pos_, 2, "--") == 0)
                {
                    pos_ += 2;
                    state_ = State::Done;
                    return {MultipartEvent::Done, {}};
                }
                const auto line_end = buffer_.find("\r\n", pos_);
                if (line_end == std::string::npos)
                {
                    if (buffer_.size() - pos_ > kMaxHeaderBytes)
                    {
                        throw MultipartError("Malformed multipart delimiter line");
                    }
                    return {};
                }
                if (!trim(std::string_view(buffer_).substr(pos_, line_end - pos_)).empty())
                {
                    throw MultipartError("Unexpected data after multipart delimiter");
                }
                pos_ = line_end + 2;
                state_ = State::Headers;
                break;
            }
            case State::Headers:
            {
                std::size_t block_end = std::string::npos;
                std::size_t body_begin = std::string::npos;
                if (buffer_.compare(pos_, 2, "\r\n") == 0)
                {
                    block_end = pos_;
                    body_begin = pos_ + 2;
                }
                else if (const auto found = buffer_.find("\r\n\r\n", pos_); found != std::string::npos)
                {
                    block_end = found;
                    body_begin = found + 4;
                }
                if (block_end == std::string::npos)
                {
                    if (buffer_.size() - pos_ > kMaxHeaderBytes)
                    {
                        throw MultipartError("Multipart part headers too large");
                    }
                    return {};
                }
                parse_headers(std::string_view(buffer_).substr(pos_, block_end - pos_));
                pos_ = body_begin;
                state_ = State::Body;
                return {MultipartEvent::PartBegin, {}};
            }
            case State::Body:
            {
                const auto found = buffer_.find(delimiter_, pos_);
                if (found == pos_)
                {
                    pos_ += delimiter_.size();
                    state_ = State::AfterDelimiter;
                    return {MultipartEvent::PartEnd, {}};
                }
                if (found != std::string::npos)
                {
                    const auto begin = pos_;
                    pos_ = found;
                    return {MultipartEvent::Data, view(begin, found)};
                }
                const auto keep = delimiter_.size() - 1;
                const auto safe_end = buffer_.size() > keep ? buffer_.size() - keep : 0;
                if (safe_end > pos_)
                {
                    const auto begin = pos_;
                    pos_ = safe_end;
                    return {MultipartEvent::Data, view(begin, safe_end)};
                }
                return {};
            }
            case State::Done:
                return {MultipartEvent::Done, {}};
            }
        }
    }

    void MultipartReader::parse_headers(std::string_view block)
    {
        part_ = MultipartPart{};
        bool has_disposition = false;
        while (!block.empty())
        {
            const auto line_end = block.find("\r\n");
            const auto line = block.substr(0, line_end);
            block = line_end == std::string_view::npos ? std::string_view{} : block.substr(line_end + 2);

            const auto colon = line.find(':');
            if (colon == std::string_view::npos)
            {
                throw MultipartError("Malformed multipart header line");
            }
            const auto name = to_lower(trim(line.substr(0, colon)));
            const auto value = trim(line.substr(colon + 1));
            if (name == "content-disposition")
            {
                if (to_lower(trim(value.substr(0, value.find(';')))) != "form-data")
                {
                    throw MultipartError("Unsupported multipart disposition");
                }
                has_disposition = true;
                part_.name = header_parameter(value, "name").value_or("");
                part_.filename = header_parameter(value, "filename");
            }
            else if (name == "content-type")
            {
                part_.content_type = std::string(value);
            }
        }
        if (!has_disposition || part_.name.empty())
        {
            throw MultipartError("Multipart part without a field name");
        }
    }

    std::span<const std::uint8_t> MultipartReader::view(std::size_t begin, std::size_t end) const
    {
        return {reinterpret_cast<const std::uint8_t *>(buffer_.data()) + begin, end - begin};
    }

} // namespace bytebeam::protocol
