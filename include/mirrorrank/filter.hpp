#ifndef MIRRORRANK_FILTER_HPP
#define MIRRORRANK_FILTER_HPP

#include <chrono>
#include <optional>
#include <vector>

#include <mirrorrank/export.hpp>
#include <mirrorrank/directory.hpp>
#include <mirrorrank/enums.hpp>

namespace mirrorrank
{
    // Criteria an endpoint must all satisfy to be kept. Default values keep everything.
    struct MIRRORRANK_API FilterCriteria
    {
        // Only keep endpoints synchronized less than `max_age_hours` hours ago. Endpoints with
        // an unknown synchronisation time are dropped when this is set.
        std::optional<double> max_age_hours;

        bool isos = false;
        bool ipv4 = false;
        bool ipv6 = false;

        // Only keep these protocols. Empty means any protocol.
        std::vector<Protocol> protocols;

        bool keep(const Endpoint& endpoint,
                  std::chrono::system_clock::time_point now
                  = std::chrono::system_clock::now()) const;
    };

    // Age in hours, as the whole hours plus the remaining minutes over 60
    // (both truncated toward zero): 1h59m59s is 1.983, -10m is -0.167.
    MIRRORRANK_API double age_in_hours(std::chrono::system_clock::duration age) noexcept;

    MIRRORRANK_API Directory filter(Directory directory,
                                    const FilterCriteria& criteria,
                                    std::chrono::system_clock::time_point now
                                    = std::chrono::system_clock::now());
}

#endif
