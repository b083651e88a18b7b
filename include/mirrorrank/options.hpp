#ifndef MIRRORRANK_OPTIONS_HPP
#define MIRRORRANK_OPTIONS_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <mirrorrank/export.hpp>
#include <mirrorrank/context.hpp>
#include <mirrorrank/enums.hpp>
#include <mirrorrank/filter.hpp>
#include <mirrorrank/prober.hpp>

namespace mirrorrank
{
    namespace fs = std::filesystem;

    inline constexpr std::size_t DEFAULT_NUMBER = 20;
    inline constexpr std::size_t DEFAULT_PROBE_COUNT = 10;
    inline constexpr long DEFAULT_PROBE_TIMEOUT = 5;

    // What to select from a directory and how to rank it.
    struct MIRRORRANK_API Options
    {
        SortKey sort = SortKey::kSCORE;

        // Number of mirrors kept after ranking.
        std::size_t number = DEFAULT_NUMBER;

        FilterCriteria criteria;

        // Deadline of a single probe in seconds. 0 or less means no deadline.
        long probe_timeout = DEFAULT_PROBE_TIMEOUT;

        // Number of successful probes to wait for when ranking by rate.
        std::size_t probe_count = DEFAULT_PROBE_COUNT;

        // Mirror status document location. Empty means the context default.
        std::string url;

        // Where to write the mirror list. Empty means the standard output.
        fs::path save;

        bool list_countries = false;

        // Extra "Name: value" request headers.
        std::vector<std::string> headers;

        // Certificate bundle used to verify https peers. Empty means the libcurl default.
        fs::path cacert;

        probe_deadline deadline() const;
    };

    // Overrides the values of `options` with the ones set in `node`. Known keys:
    // url, number, sort, age, isos, ipv4, ipv6, protocols, timeout, probe_count, save,
    // headers, cacert.
    // Throws `std::invalid_argument` on invalid values.
    MIRRORRANK_API void load_options(const YAML::Node& node, Options& options);

    MIRRORRANK_API void load_options(const fs::path& path, Options& options);

    // Applies the transfer settings of `options` to `ctx`.
    // Throws `std::invalid_argument` on a header without a name.
    MIRRORRANK_API void configure_context(const Options& options, Context& ctx);
}

#endif
