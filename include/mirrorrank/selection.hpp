#ifndef MIRRORRANK_SELECTION_HPP
#define MIRRORRANK_SELECTION_HPP

#include <chrono>
#include <vector>

#include <mirrorrank/export.hpp>
#include <mirrorrank/directory.hpp>
#include <mirrorrank/options.hpp>
#include <mirrorrank/probe_coordinator.hpp>

namespace mirrorrank
{
    struct MIRRORRANK_API Selection
    {
        // Filtered, ranked and truncated directory.
        Directory directory;
        // Probes observed when ranking by rate, empty otherwise.
        std::vector<ProbeOutcome> outcomes;
    };

    // Filters `directory` with `options.criteria`, measures download rates with `coordinator`
    // when ranking by rate, ranks by `options.sort` and keeps the first `options.number`
    // endpoints.
    MIRRORRANK_API Selection select_endpoints(Directory directory,
                                              const Options& options,
                                              ProbeCoordinator& coordinator,
                                              std::chrono::system_clock::time_point now
                                              = std::chrono::system_clock::now());
}

#endif
