#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include <mirrorrank/utils.hpp>

namespace mirrorrank
{
    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key, value;
            key = header.substr(0, colon_idx);
            colon_idx++;
            // remove spaces
            while (colon_idx < header.size() && std::isspace(static_cast<unsigned char>(header[colon_idx])))
            {
                ++colon_idx;
            }

            // remove \r\n header ending
            value = header.substr(colon_idx);
            while (!value.empty() && (value.back() == '\n' || value.back() == '\r'))
            {
                value.remove_suffix(1);
            }
            // http headers are case insensitive!
            std::string lkey = to_lower(key);

            return std::make_pair(lkey, std::string(value));
        }
        return std::make_pair(std::string(), std::string(header));
    }

    std::string join_url(const std::string_view& base, const std::string_view& path)
    {
        if (base.empty())
            return std::string(path);
        if (path.empty())
            return std::string(base);

        std::string_view lbase = base;
        std::string_view lpath = path;
        while (!lbase.empty() && lbase.back() == '/')
            lbase.remove_suffix(1);
        while (!lpath.empty() && lpath.front() == '/')
            lpath.remove_prefix(1);
        return fmt::format("{}/{}", lbase, lpath);
    }

    std::size_t utf8_length(const std::string_view& str) noexcept
    {
        return static_cast<std::size_t>(
            std::count_if(str.begin(),
                          str.end(),
                          [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
    }

    namespace
    {
        // Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's algorithm).
        long long days_from_civil(long long y, unsigned m, unsigned d) noexcept
        {
            y -= m <= 2;
            const long long era = (y >= 0 ? y : y - 399) / 400;
            const unsigned yoe = static_cast<unsigned>(y - era * 400);
            const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<long long>(doe) - 719468;
        }

        bool is_leap(long long y) noexcept
        {
            return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
        }

        unsigned days_in_month(long long y, unsigned m) noexcept
        {
            static constexpr unsigned days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
            return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
        }

        bool read_digits(const std::string_view& s, std::size_t pos, std::size_t count, int& out)
        {
            if (pos + count > s.size())
                return false;
            out = 0;
            for (std::size_t i = pos; i < pos + count; ++i)
            {
                if (!std::isdigit(static_cast<unsigned char>(s[i])))
                    return false;
                out = out * 10 + (s[i] - '0');
            }
            return true;
        }
    }

    std::optional<std::chrono::system_clock::time_point> parse_rfc3339(
        const std::string_view& input)
    {
        int year, month, day, hour, minute, second;
        if (input.size() < 20 || !read_digits(input, 0, 4, year) || input[4] != '-'
            || !read_digits(input, 5, 2, month) || input[7] != '-'
            || !read_digits(input, 8, 2, day)
            || (input[10] != 'T' && input[10] != 't' && input[10] != ' ')
            || !read_digits(input, 11, 2, hour) || input[13] != ':'
            || !read_digits(input, 14, 2, minute) || input[16] != ':'
            || !read_digits(input, 17, 2, second))
        {
            return std::nullopt;
        }

        if (month < 1 || month > 12 || day < 1
            || day > static_cast<int>(days_in_month(year, month)) || hour > 23 || minute > 59
            || second > 60)
        {
            return std::nullopt;
        }

        std::size_t pos = 19;
        std::chrono::nanoseconds fraction{ 0 };
        if (input[pos] == '.')
        {
            ++pos;
            const std::size_t start = pos;
            long long scale = 100000000;
            while (pos < input.size() && std::isdigit(static_cast<unsigned char>(input[pos])))
            {
                fraction += std::chrono::nanoseconds((input[pos] - '0') * scale);
                scale /= 10;
                ++pos;
            }
            if (pos == start)
                return std::nullopt;
        }

        std::chrono::minutes offset{ 0 };
        if (pos < input.size() && (input[pos] == 'Z' || input[pos] == 'z'))
        {
            ++pos;
        }
        else if (pos < input.size() && (input[pos] == '+' || input[pos] == '-'))
        {
            int off_h, off_m;
            if (!read_digits(input, pos + 1, 2, off_h) || pos + 3 >= input.size()
                || input[pos + 3] != ':' || !read_digits(input, pos + 4, 2, off_m) || off_h > 23
                || off_m > 59)
            {
                return std::nullopt;
            }
            offset = std::chrono::hours(off_h) + std::chrono::minutes(off_m);
            if (input[pos] == '-')
                offset = -offset;
            pos += 6;
        }
        else
        {
            return std::nullopt;
        }

        if (pos != input.size())
            return std::nullopt;

        const long long days = days_from_civil(year, month, day);
        const auto since_epoch = std::chrono::hours(days * 24) + std::chrono::hours(hour)
                                 + std::chrono::minutes(minute) + std::chrono::seconds(second)
                                 - offset;
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(since_epoch + fraction));
    }
}
