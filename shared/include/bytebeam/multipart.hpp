/**
 * ByteBeam - Incremental multipart/form-data reader.
 *
 * The reader is fed raw body bytes as they arrive and is then pulled for
 * events until it reports NeedMore. Data spans point into the reader's own
 * buffer and stay valid only until the next call to feed() or next().
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bytebeam::protocol
{

    class MultipartError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct MultipartPart
    {
        std::string name;
        std::optional<std::string> filename{};
        std::string content_type{};
    };

    enum class MultipartEvent : std::uint8_t
    {
        NeedMore,
        PartBegin,
        Data,
        PartEnd,
        Done
    };

    struct MultipartItem
    {
        MultipartEvent event{MultipartEvent::NeedMore};
        std::span<const std::uint8_t> data{};
    };

    class MultipartReader
    {
    public:
        explicit MultipartReader(std::string_view boundary);

        // Extracts the boundary parameter of a multipart/form-data Content-Type.
        static std::optional<std::string> boundary_from_content_type(std::string_view content_type);

        void feed(std::span<const std::uint8_t> bytes);

        MultipartItem next();

        const MultipartPart &part() const noexcept { return part_; }

        bool done() const noexcept { return state_ == State::Done; }

    private:
        enum class State : std::uint8_t
        {
            Preamble,
            AfterDelimiter,
            Headers,
            Body,
            Done
        };

        void parse_headers(std::string_view block);
        std::span<const std::uint8_t> view(std::size_t begin, std::size_t end) const;

        std::string delimiter_;
        std::string buffer_;
        std::size_t pos_{0};
        State state_{State::Preamble};
        MultipartPart part_{};
    };

} // namespace bytebeam::protocol
