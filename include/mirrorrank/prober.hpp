#ifndef MIRRORRANK_PROBER_HPP
#define MIRRORRANK_PROBER_HPP

#include <atomic>
#include <chrono>
#include <optional>

#include <tl/expected.hpp>

#include <mirrorrank/export.hpp>
#include <mirrorrank/endpoint.hpp>
#include <mirrorrank/errors.hpp>

namespace mirrorrank
{
    class Context;

    // Maximum duration of a single probe. No value means no limit.
    using probe_deadline = std::optional<std::chrono::milliseconds>;
    using probe_result = tl::expected<Endpoint, MirrorError>;

    // Download rate in kB/s of a transfer of `bytes` bytes which took `elapsed`.
    // A transfer which received nothing has a NaN rate: the mirror answered, but there is
    // nothing to measure.
    MIRRORRANK_API double compute_rate(std::chrono::duration<double, std::milli> elapsed,
                                       std::size_t bytes) noexcept;

    // Measures the download rate of one endpoint.
    //
    // Implementations must not keep any reference to the endpoint they are given and must be
    // callable concurrently from several threads.
    class MIRRORRANK_API Prober
    {
    public:
        virtual ~Prober();

        // Performs one timed transfer against `endpoint` and returns a copy of it carrying the
        // measured rate.
        // Fails with `MR_TIMEOUT` if `deadline` elapses first, with `MR_CANCELLED` once
        // `cancelled` is set, and with `MR_CURL` / `MR_BADSTATUS` for any other failure.
        probe_result probe(Endpoint endpoint,
                           const probe_deadline& deadline,
                           const std::atomic<bool>& cancelled) const;

        probe_result probe(Endpoint endpoint, const probe_deadline& deadline = std::nullopt) const;

    protected:
        virtual probe_result do_probe(Endpoint endpoint,
                                      const probe_deadline& deadline,
                                      const std::atomic<bool>& cancelled) const = 0;
    };

    // Prober downloading `Context::probe_path` from the endpoint with libcurl.
    // The context must outlive the prober.
    class MIRRORRANK_API CurlProber : public Prober
    {
    public:
        explicit CurlProber(const Context& ctx);

    protected:
        probe_result do_probe(Endpoint endpoint,
                              const probe_deadline& deadline,
                              const std::atomic<bool>& cancelled) const override;

    private:
        const Context& m_ctx;
    };
}

#endif
