#include "bytebeam/encoding/url.hpp"

#include <cctype>
#include <utility>

namespace bytebeam::encoding
{

    namespace
    {

        int hex_value(char c) noexcept
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            return -1;
        }

        bool is_unreserved(unsigned char c) noexcept
        {
            return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
        }

    } // namespace

    std::optional<std::string> url_decode(std::string_view input, bool form)
    {
        std::string output;
        output.reserve(input.size());
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            const char c = input[i];
            if (c == '%')
            {
                if (i + 2 >= input.size())
                {
                    return std::nullopt;
                }
                const int high = hex_value(input[i + 1]);
                const int low = hex_value(input[i + 2]);
                if (high < 0 || low < 0)
                {
                    return std::nullopt;
                }
                output.push_back(static_cast<char>((high << 4) | low));
                i += 2;
            }
            else if (c == '+' && form)
            {
                output.push_back(' ');
            }
            else
            {
                output.push_back(c);
            }
        }
        return output;
    }

    std::string url_encode(std::string_view input)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string output;
        output.reserve(input.size());
        for (const char ch : input)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (is_unreserved(c))
            {
                output.push_back(ch);
            }
            else
            {
                output.push_back('%');
                output.push_back(kHexDigits[(c >> 4) & 0x0F]);
                output.push_back(kHexDigits[c & 0x0F]);
            }
        }
        return output;
    }

    FieldMap parse_form(std::string_view input)
    {
        FieldMap fields;
        while (!input.empty())
        {
            const auto amp = input.find('&');
            const auto pair = input.substr(0, amp);
            input = amp == std::string_view::npos ? std::string_view{} : input.substr(amp + 1);
            if (pair.empty())
            {
                continue;
            }
            const auto eq = pair.find('=');
            auto key = url_decode(pair.substr(0, eq), true);
            auto value = eq == std::string_view::npos ? std::optional<std::string>{std::string{}}
                                                      : url_decode(pair.substr(eq + 1), true);
            if (!key || !value || key->empty())
            {
                continue;
            }
            fields.emplace(std::move(*key), std::move(*value));
        }
        return fields;
    }

    std::optional<Target> parse_target(std::string_view target)
    {
        Target result;
        const auto question = target.find('?');
        auto path = target.substr(0, question);
        if (question != std::string_view::npos)
        {
            result.query = parse_form(target.substr(question + 1));
        }
        if (path.empty() || path.front() != '/')
        {
            return std::nullopt;
        }
        path.remove_prefix(1);
        while (!path.empty())
        {
            const auto slash = path.find('/');
            auto segment = url_decode(path.substr(0, slash));
            if (!segment)
            {
                return std::nullopt;
            }
            if (!segment->empty())
            {
                result.segments.push_back(std::move(*segment));
            }
            if (slash == std::string_view::npos)
            {
                break;
            }
            path.remove_prefix(slash + 1);
        }
        return result;
    }

    bool is_truthy(std::string_view value) noexcept
    {
        return value == "true" || value == "1" || value == "yes";
    }

} // namespace bytebeam::encoding
