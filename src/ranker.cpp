#include <algorithm>
#include <cmath>
#include <limits>

#include <mirrorrank/ranker.hpp>

namespace mirrorrank
{
    namespace details
    {
        bool faster_than(const std::optional<double>& lhs,
                         const std::optional<double>& rhs) noexcept
        {
            const bool lhs_valid = lhs.has_value() && !std::isnan(lhs.value());
            const bool rhs_valid = rhs.has_value() && !std::isnan(rhs.value());
            if (!lhs_valid)
                return false;
            if (!rhs_valid)
                return true;
            return lhs.value() > rhs.value();
        }

        long long rounded_key(const std::optional<double>& value) noexcept
        {
            constexpr long long max_key = std::numeric_limits<long long>::max();
            constexpr long long min_key = std::numeric_limits<long long>::min();
            if (!value || std::isnan(value.value()))
                return max_key;

            const double rounded = std::round(value.value());
            // saturate instead of overflowing
            if (rounded >= static_cast<double>(max_key))
                return max_key;
            if (rounded <= static_cast<double>(min_key))
                return min_key;
            return static_cast<long long>(rounded);
        }
    }

    Directory rank(Directory directory, SortKey key)
    {
        using clock = std::chrono::system_clock;

        std::optional<std::string> source = directory.source();
        endpoint_list endpoints = directory.take_endpoints();

        switch (key)
        {
            case SortKey::kAGE:
                std::stable_sort(endpoints.begin(),
                                 endpoints.end(),
                                 [](const Endpoint& lhs, const Endpoint& rhs)
                                 {
                                     return lhs.last_sync().value_or(clock::time_point::min())
                                            < rhs.last_sync().value_or(clock::time_point::min());
                                 });
                break;
            case SortKey::kRATE:
                std::stable_sort(endpoints.begin(),
                                 endpoints.end(),
                                 [](const Endpoint& lhs, const Endpoint& rhs)
                                 {
                                     return details::faster_than(lhs.download_rate(),
                                                                 rhs.download_rate());
                                 });
                break;
            case SortKey::kCOUNTRY:
                std::stable_sort(endpoints.begin(),
                                 endpoints.end(),
                                 [](const Endpoint& lhs, const Endpoint& rhs)
                                 {
                                     return lhs.country().value_or(std::string())
                                            < rhs.country().value_or(std::string());
                                 });
                break;
            case SortKey::kSCORE:
                std::stable_sort(endpoints.begin(),
                                 endpoints.end(),
                                 [](const Endpoint& lhs, const Endpoint& rhs)
                                 {
                                     return details::rounded_key(lhs.score())
                                            < details::rounded_key(rhs.score());
                                 });
                break;
            case SortKey::kDELAY:
                std::stable_sort(endpoints.begin(),
                                 endpoints.end(),
                                 [](const Endpoint& lhs, const Endpoint& rhs)
                                 {
                                     return details::rounded_key(lhs.delay())
                                            < details::rounded_key(rhs.delay());
                                 });
                break;
        }

        return Directory(std::move(endpoints), std::move(source));
    }
}
