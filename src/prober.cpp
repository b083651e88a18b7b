#include <cmath>
#include <limits>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorrank/context.hpp>
#include <mirrorrank/prober.hpp>

#include "curl_internal.hpp"

namespace mirrorrank
{
    double compute_rate(std::chrono::duration<double, std::milli> elapsed,
                        std::size_t bytes) noexcept
    {
        if (bytes == 0)
            return std::numeric_limits<double>::quiet_NaN();
        return static_cast<double>(bytes) / (1000.0 * elapsed.count());
    }

    /**********
     * Prober *
     **********/

    Prober::~Prober() = default;

    probe_result Prober::probe(Endpoint endpoint,
                               const probe_deadline& deadline,
                               const std::atomic<bool>& cancelled) const
    {
        if (cancelled.load())
        {
            return tl::unexpected(MirrorError{ ErrorLevel::INFO,
                                               ErrorCode::MR_CANCELLED,
                                               fmt::format("Probe of {} cancelled",
                                                           endpoint.url()) });
        }
        if (deadline && deadline->count() <= 0)
        {
            return tl::unexpected(MirrorError{ ErrorLevel::INFO,
                                               ErrorCode::MR_TIMEOUT,
                                               fmt::format("Probe of {} timed out",
                                                           endpoint.url()) });
        }
        return do_probe(std::move(endpoint), deadline, cancelled);
    }

    probe_result Prober::probe(Endpoint endpoint, const probe_deadline& deadline) const
    {
        const std::atomic<bool> never_cancelled{ false };
        return probe(std::move(endpoint), deadline, never_cancelled);
    }

    /**************
     * CurlProber *
     **************/

    namespace
    {
        std::size_t count_callback(char* /*buffer*/,
                                   std::size_t size,
                                   std::size_t nitems,
                                   void* data)
        {
            *static_cast<std::size_t*>(data) += size * nitems;
            return size * nitems;
        }

        ErrorCode probe_error_code(CURLcode code, bool has_deadline)
        {
            switch (code)
            {
                case CURLE_OPERATION_TIMEDOUT:
                    // without a deadline, only connection / low speed limits can time out
                    return has_deadline ? ErrorCode::MR_TIMEOUT : ErrorCode::MR_CURL;
                case CURLE_ABORTED_BY_CALLBACK:
                    return ErrorCode::MR_CANCELLED;
                case CURLE_HTTP_RETURNED_ERROR:
                    return ErrorCode::MR_BADSTATUS;
                default:
                    return ErrorCode::MR_CURL;
            }
        }
    }

    CurlProber::CurlProber(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    probe_result CurlProber::do_probe(Endpoint endpoint,
                                      const probe_deadline& deadline,
                                      const std::atomic<bool>& cancelled) const
    {
        const std::string url = endpoint.resource_url(m_ctx.probe_path);
        spdlog::debug("Probing {}", url);

        std::size_t received = 0;
        CURLcode result;
        std::chrono::steady_clock::duration elapsed;
        try
        {
            CURLHandle h(m_ctx, url);
            h.setopt(CURLOPT_FAILONERROR, 1L);
            h.setopt(CURLOPT_WRITEFUNCTION, &count_callback);
            h.setopt(CURLOPT_WRITEDATA, &received);
            h.abort_on(&cancelled);
            if (deadline)
            {
                h.timeout(deadline.value());
            }

            const auto start = std::chrono::steady_clock::now();
            result = h.perform_raw();
            elapsed = std::chrono::steady_clock::now() - start;

            if (result != CURLE_OK)
            {
                return tl::unexpected(
                    MirrorError{ ErrorLevel::INFO,
                                 probe_error_code(result, deadline.has_value()),
                                 fmt::format("Probe of {} failed: {}",
                                             endpoint.url(),
                                             h.error_message(result)) });
            }
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(MirrorError{
                ErrorLevel::SERIOUS,
                ErrorCode::MR_CURLSETOPT,
                fmt::format("Could not prepare probe of {}: {}", endpoint.url(), e.what()) });
        }

        const double rate = compute_rate(elapsed, received);
        spdlog::info("Download rate updated for url {}: {} kB/s", endpoint.url(), rate);
        return endpoint.with_download_rate(rate);
    }
}
