#ifndef MIRRORRANK_UTILS_HPP
#define MIRRORRANK_UTILS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mirrorrank/export.hpp>

namespace mirrorrank
{
    MIRRORRANK_API std::string string_transform(const std::string_view& input,
                                                int (*functor)(int));
    MIRRORRANK_API std::string to_lower(const std::string_view& input);

    MIRRORRANK_API std::pair<std::string, std::string> parse_header(
        const std::string_view& header);

    // Joins a base url and a relative path with exactly one '/' between them.
    MIRRORRANK_API std::string join_url(const std::string_view& base, const std::string_view& path);

    // Number of code points of an UTF-8 encoded string (continuation bytes are not counted).
    MIRRORRANK_API std::size_t utf8_length(const std::string_view& str) noexcept;

    // Parses an RFC 3339 timestamp such as `2024-05-01T14:25:08Z` or
    // `2024-05-01T16:25:08.123+02:00`. Returns an empty optional if the input is malformed.
    MIRRORRANK_API std::optional<std::chrono::system_clock::time_point> parse_rfc3339(
        const std::string_view& input);
}

#endif
