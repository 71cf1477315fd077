/**
 * ByteBeam - Percent-encoding and query/form helpers.
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bytebeam::encoding
{

    // Returns nullopt on a malformed escape. '+' decodes to a space only in form mode.
    std::optional<std::string> url_decode(std::string_view input, bool form = false);

    // Encodes everything outside the RFC 3986 unreserved set.
    std::string url_encode(std::string_view input);

    using FieldMap = std::map<std::string, std::string, std::less<>>;

    // Parses "a=1&b=2" (query strings and application/x-www-form-urlencoded bodies).
    FieldMap parse_form(std::string_view input);

    struct Target
    {
        std::vector<std::string> segments;
        FieldMap query;
    };

    // Splits a request target into decoded path segments and query fields.
    std::optional<Target> parse_target(std::string_view target);

    bool is_truthy(std::string_view value) noexcept;

} // namespace bytebeam::encoding
