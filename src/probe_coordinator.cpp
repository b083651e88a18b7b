#include <algorithm>
#include <limits>
#include <set>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorrank/probe_coordinator.hpp>

#include "completion_channel.hpp"

namespace mirrorrank
{
    namespace
    {
        struct Completion
        {
            std::size_t index;
            probe_result result;
        };

        using completion_channel = details::CompletionChannel<Completion>;
    }

    std::size_t ProbeReport::count_successes() const
    {
        return static_cast<std::size_t>(std::count_if(outcomes.begin(),
                                                      outcomes.end(),
                                                      [](const ProbeOutcome& o)
                                                      { return o.rate.has_value(); }));
    }

    ProbeCoordinator::ProbeCoordinator(std::shared_ptr<const Prober> prober)
        : m_prober(std::move(prober))
    {
        if (!m_prober)
            throw std::invalid_argument("ProbeCoordinator requires a prober");
    }

    ProbeCoordinator::~ProbeCoordinator()
    {
        shutdown();
    }

    void ProbeCoordinator::shutdown()
    {
        for (auto& task : m_tasks)
        {
            task.cancelled->store(true);
        }
        for (auto& task : m_tasks)
        {
            if (task.thread.joinable())
                task.thread.join();
        }
        m_tasks.clear();
    }

    std::size_t ProbeCoordinator::pending_tasks() const
    {
        return m_tasks.size();
    }

    void ProbeCoordinator::join_finished()
    {
        auto finished = std::partition(m_tasks.begin(),
                                       m_tasks.end(),
                                       [](const Task& task) { return !task.done->load(); });
        for (auto it = finished; it != m_tasks.end(); ++it)
        {
            if (it->thread.joinable())
                it->thread.join();
        }
        m_tasks.erase(finished, m_tasks.end());
    }

    ProbeReport ProbeCoordinator::update_download_rates(Directory directory,
                                                        const probe_deadline& deadline,
                                                        std::size_t limit)
    {
        join_finished();

        std::optional<std::string> source = directory.source();
        endpoint_list pending = directory.take_endpoints();
        const std::size_t count = pending.size();
        std::size_t left = std::min(count, limit);

        ProbeReport report;
        if (left == 0)
        {
            report.directory = Directory(std::move(pending), std::move(source));
            return report;
        }

        // Kept to put back every endpoint which has not been updated.
        const endpoint_list originals = pending;

        auto channel = std::make_shared<completion_channel>();
        auto cancelled = std::make_shared<std::atomic<bool>>(false);

        // A started thread must never be left outside of m_tasks.
        m_tasks.reserve(m_tasks.size() + count);
        for (std::size_t i = 0; i < count; ++i)
        {
            auto done = std::make_shared<std::atomic<bool>>(false);
            auto task = [prober = m_prober,
                         channel,
                         cancelled,
                         done,
                         deadline,
                         index = i,
                         endpoint = std::move(pending[i])]() mutable
            {
                probe_result result = tl::unexpected(
                    MirrorError{ ErrorLevel::SERIOUS, ErrorCode::MR_UNKNOWNERROR, "no result" });
                try
                {
                    result = prober->probe(std::move(endpoint), deadline, *cancelled);
                }
                catch (const std::exception& e)
                {
                    result = tl::unexpected(MirrorError{
                        ErrorLevel::SERIOUS,
                        ErrorCode::MR_UNKNOWNERROR,
                        fmt::format("Probe raised an exception: {}", e.what()) });
                }
                // Nothing but the thread exit follows: joining a done task does not block.
                done->store(true);
                channel->send(Completion{ index, std::move(result) });
            };

            try
            {
                m_tasks.push_back(Task{ std::thread(std::move(task)), done, cancelled });
            }
            catch (const std::system_error& e)
            {
                channel->send(Completion{
                    i,
                    tl::unexpected(MirrorError{
                        ErrorLevel::SERIOUS,
                        ErrorCode::MR_UNKNOWNERROR,
                        fmt::format(
                            "Could not start probe of {}: {}", originals[i].url(), e.what()) }) });
            }
        }

        endpoint_list updated;
        std::size_t reported = 0;
        while (left > 0 && reported < count)
        {
            Completion completion = channel->receive();
            ++reported;

            const std::string& url = originals[completion.index].url();
            if (completion.result)
            {
                const double rate = completion.result->download_rate().value_or(
                    std::numeric_limits<double>::quiet_NaN());
                report.outcomes.push_back(ProbeOutcome{ url, rate });
                updated.push_back(std::move(completion.result.value()));
                --left;
            }
            else
            {
                completion.result.error().log();
                spdlog::debug("Failed to update mirror {}", url);
                report.outcomes.push_back(
                    ProbeOutcome{ url, tl::unexpected(completion.result.error()) });
            }
        }

        if (reported < count)
        {
            spdlog::debug("Enough mirrors updated ({} of {} reported)", reported, count);
            cancelled->store(true);
        }

        // push back the endpoints which were not updated
        std::set<std::string> updated_urls;
        for (const auto& endpoint : updated)
        {
            updated_urls.insert(endpoint.url());
        }
        for (const auto& endpoint : originals)
        {
            if (updated_urls.find(endpoint.url()) == updated_urls.end())
            {
                updated.push_back(endpoint);
            }
        }

        report.directory = Directory(std::move(updated), std::move(source));
        return report;
    }
}
