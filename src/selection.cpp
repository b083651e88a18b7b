#include <spdlog/spdlog.h>

#include <mirrorrank/filter.hpp>
#include <mirrorrank/ranker.hpp>
#include <mirrorrank/selection.hpp>

namespace mirrorrank
{
    Selection select_endpoints(Directory directory,
                               const Options& options,
                               ProbeCoordinator& coordinator,
                               std::chrono::system_clock::time_point now)
    {
        Selection selection;

        const std::size_t total = directory.size();
        directory = filter(std::move(directory), options.criteria, now);
        spdlog::debug("{} of {} mirrors left after filtering", directory.size(), total);

        if (options.sort == SortKey::kRATE)
        {
            ProbeReport report = coordinator.update_download_rates(
                std::move(directory), options.deadline(), options.probe_count);
            spdlog::info("Measured download rate of {} mirrors", report.count_successes());
            directory = std::move(report.directory);
            selection.outcomes = std::move(report.outcomes);
        }

        directory = rank(std::move(directory), options.sort);
        directory.truncate(options.number);
        selection.directory = std::move(directory);
        return selection;
    }
}
