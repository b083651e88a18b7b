#include <algorithm>

#include <mirrorrank/filter.hpp>

namespace mirrorrank
{
    double age_in_hours(std::chrono::system_clock::duration age) noexcept
    {
        const auto hours = std::chrono::duration_cast<std::chrono::hours>(age);
        const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(age - hours);
        return static_cast<double>(hours.count()) + static_cast<double>(minutes.count()) / 60.0;
    }

    bool FilterCriteria::keep(const Endpoint& endpoint,
                              std::chrono::system_clock::time_point now) const
    {
        if (max_age_hours)
        {
            const auto age = endpoint.age(now);
            if (!age || !(age_in_hours(age.value()) < max_age_hours.value()))
                return false;
        }
        if (isos && !endpoint.has_isos())
            return false;
        if (ipv4 && !endpoint.has_ipv4())
            return false;
        if (ipv6 && !endpoint.has_ipv6())
            return false;
        if (!protocols.empty()
            && std::find(protocols.begin(), protocols.end(), endpoint.protocol())
                   == protocols.end())
        {
            return false;
        }
        return true;
    }

    Directory filter(Directory directory,
                     const FilterCriteria& criteria,
                     std::chrono::system_clock::time_point now)
    {
        std::optional<std::string> source = directory.source();
        endpoint_list endpoints = directory.take_endpoints();
        endpoints.erase(std::remove_if(endpoints.begin(),
                                       endpoints.end(),
                                       [&](const Endpoint& e) { return !criteria.keep(e, now); }),
                        endpoints.end());
        return Directory(std::move(endpoints), std::move(source));
    }
}
