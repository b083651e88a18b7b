#ifndef MIRRORRANK_RANKER_HPP
#define MIRRORRANK_RANKER_HPP

#include <optional>

#include <mirrorrank/export.hpp>
#include <mirrorrank/directory.hpp>
#include <mirrorrank/enums.hpp>

namespace mirrorrank
{
    namespace details
    {
        // Total order on measured rates, fastest first: missing and NaN rates come after every
        // real value and are equivalent to each other.
        MIRRORRANK_API bool faster_than(const std::optional<double>& lhs,
                                        const std::optional<double>& rhs) noexcept;

        // Sort key of a score or a delay: the value rounded to the nearest integer, missing
        // and NaN values being the greatest key.
        MIRRORRANK_API long long rounded_key(const std::optional<double>& value) noexcept;
    }

    // Stable sort of the endpoints of `directory` by `key`. Endpoints comparing equal keep
    // their relative order.
    //
    //  - kAGE: oldest synchronisation first, unknown synchronisation before everything
    //  - kRATE: fastest first, unmeasured and NaN rates last
    //  - kCOUNTRY: country name (byte order), unknown country is the empty name
    //  - kSCORE, kDELAY: rounded value ascending, unknown values last
    MIRRORRANK_API Directory rank(Directory directory, SortKey key);
}

#endif
