#ifndef MIRRORRANK_RENDER_HPP
#define MIRRORRANK_RENDER_HPP

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <utility>

#include <tl/expected.hpp>

#include <mirrorrank/export.hpp>
#include <mirrorrank/directory.hpp>
#include <mirrorrank/errors.hpp>

namespace mirrorrank
{
    namespace fs = std::filesystem;

    // (country, country code) -> number of mirrors
    using country_count_map = std::map<std::pair<std::string, std::string>, std::size_t>;

    // Counts the mirrors of every country. Mirrors without a country or a country code are
    // ignored.
    MIRRORRANK_API country_count_map count_countries(const Directory& directory);

    // Content of a pacman mirror list: comment header then one `Server = ` line for each of
    // the first `number` endpoints.
    MIRRORRANK_API std::string mirrorlist_content(const Directory& directory, std::size_t number);

    // Table of the countries mirrors are located in, with their code and mirror count.
    MIRRORRANK_API std::string country_report(const Directory& directory);

    MIRRORRANK_API tl::expected<void, MirrorError> write_mirrorlist(const fs::path& path,
                                                                    const std::string& content);
}

#endif
