#ifndef MIRRORRANK_PROBE_COORDINATOR_HPP
#define MIRRORRANK_PROBE_COORDINATOR_HPP

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <tl/expected.hpp>

#include <mirrorrank/export.hpp>
#include <mirrorrank/directory.hpp>
#include <mirrorrank/errors.hpp>
#include <mirrorrank/prober.hpp>

namespace mirrorrank
{
    // Result of one probe, as observed by the coordinator.
    struct ProbeOutcome
    {
        std::string url;
        // Measured rate (possibly NaN) or the reason of the failure.
        tl::expected<double, MirrorError> rate;
    };

    struct ProbeReport
    {
        Directory directory;
        // One entry per completion consumed before the coordinator stopped listening,
        // in completion order.
        std::vector<ProbeOutcome> outcomes;

        std::size_t count_successes() const;
    };

    // Probes every endpoint of a directory concurrently, one thread per endpoint, and stops
    // listening as soon as enough probes succeeded.
    //
    // Probes still running when `update_download_rates` returns are asked to stop and are
    // joined by `shutdown` or by the destructor. The prober (and whatever it references)
    // must therefore outlive the coordinator.
    class MIRRORRANK_API ProbeCoordinator
    {
    public:
        explicit ProbeCoordinator(std::shared_ptr<const Prober> prober);
        ~ProbeCoordinator();

        ProbeCoordinator(const ProbeCoordinator&) = delete;
        ProbeCoordinator& operator=(const ProbeCoordinator&) = delete;
        ProbeCoordinator(ProbeCoordinator&&) = delete;
        ProbeCoordinator& operator=(ProbeCoordinator&&) = delete;

        // Measures the download rate of up to `limit` endpoints of `directory`.
        //
        // The returned directory holds every endpoint of `directory` exactly once: first the
        // successfully probed ones (carrying their rate) in completion order, then all the
        // others unchanged, in their original order.
        // `limit` is clamped to the directory size; 0 disables probing.
        ProbeReport update_download_rates(Directory directory,
                                          const probe_deadline& deadline,
                                          std::size_t limit);

        // Asks every probe still running to stop and waits for them.
        void shutdown();

        // Threads started and not joined yet. Finished ones are joined at the start of
        // the next `update_download_rates`.
        std::size_t pending_tasks() const;

    private:
        struct Task
        {
            std::thread thread;
            // Set by the thread once its result is sent.
            std::shared_ptr<std::atomic<bool>> done;
            // Shared by every task of one `update_download_rates` call.
            std::shared_ptr<std::atomic<bool>> cancelled;
        };

        void join_finished();

        std::shared_ptr<const Prober> m_prober;
        std::vector<Task> m_tasks;
    };
}

#endif
