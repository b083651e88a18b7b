#include <algorithm>
#include <fstream>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <mirrorrank/render.hpp>
#include <mirrorrank/utils.hpp>

namespace mirrorrank
{
    namespace
    {
        constexpr std::size_t country_header_width = 7;  // "Country"

        std::string padding(std::size_t width, std::size_t used)
        {
            return std::string(width > used ? width - used : 0, ' ');
        }

        std::string country_line(const std::string& country,
                                 const std::string& code,
                                 std::size_t count,
                                 std::size_t country_width)
        {
            return fmt::format("{}{} {:>4} {:>4}",
                               country,
                               padding(country_width, utf8_length(country)),
                               code,
                               count);
        }
    }

    country_count_map count_countries(const Directory& directory)
    {
        country_count_map countries;
        for (const auto& endpoint : directory)
        {
            if (!endpoint.country() || !endpoint.country_code())
                continue;
            ++countries[{ endpoint.country().value(), endpoint.country_code().value() }];
        }
        return countries;
    }

    std::string mirrorlist_content(const Directory& directory, std::size_t number)
    {
        std::vector<std::string> lines
            = { "# Arch Linux mirror list generated by mirrorrank", "#" };
        if (directory.source())
        {
            lines.push_back(fmt::format("# from: \t{}", directory.source().value()));
        }
        lines.push_back("");

        const std::size_t limit = std::min(number, directory.size());
        for (std::size_t i = 0; i < limit; ++i)
        {
            lines.push_back(fmt::format("Server = {}$repo/os/$arch", directory[i].url()));
        }
        return fmt::format("{}\n", fmt::join(lines, "\n"));
    }

    std::string country_report(const Directory& directory)
    {
        const country_count_map countries = count_countries(directory);

        std::size_t width = country_header_width;
        for (const auto& [key, count] : countries)
        {
            width = std::max(width, utf8_length(key.first));
        }

        std::vector<std::string> lines;
        lines.push_back(
            fmt::format("Country{} Code Count", padding(width, country_header_width)));
        lines.push_back(fmt::format("{} ---- ----", std::string(width, '-')));
        for (const auto& [key, count] : countries)
        {
            if (key.first.empty())
                continue;
            lines.push_back(country_line(key.first, key.second, count, width));
        }
        return fmt::format("{}\n", fmt::join(lines, "\n"));
    }

    tl::expected<void, MirrorError> write_mirrorlist(const fs::path& path,
                                                     const std::string& content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (out)
        {
            out << content;
            out.flush();
        }
        if (!out)
        {
            return tl::unexpected(
                MirrorError{ ErrorLevel::FATAL,
                             ErrorCode::MR_IO,
                             fmt::format("Could not write mirror list to {}", path.string()) });
        }
        spdlog::info("Mirror list written to {}", path.string());
        return {};
    }
}
