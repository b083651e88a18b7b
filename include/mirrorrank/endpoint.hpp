#ifndef MIRRORRANK_ENDPOINT_HPP
#define MIRRORRANK_ENDPOINT_HPP

#include <chrono>
#include <optional>
#include <string>

#include <mirrorrank/export.hpp>
#include <mirrorrank/enums.hpp>

namespace mirrorrank
{
    // Status values published for a mirror. Every field may be unknown.
    struct EndpointStatus
    {
        // Mirror status score. The lower, the better.
        std::optional<double> score;
        // Synchronisation delay in seconds. The lower, the better.
        std::optional<double> delay;
        std::optional<std::string> country;
        // Two letters country code.
        std::optional<std::string> country_code;
        std::optional<std::chrono::system_clock::time_point> last_sync;

        // Capability flags: an unknown flag is not the same as `false`.
        std::optional<bool> isos;
        std::optional<bool> ipv4;
        std::optional<bool> ipv6;

        // Url of the detailed status page, carried through unchanged.
        std::string details;
    };

    // One candidate mirror. Values are immutable once built; the measured download rate is
    // the only thing that changes and it does so by building a new value
    // (see `with_download_rate`).
    class MIRRORRANK_API Endpoint
    {
    public:
        using clock = std::chrono::system_clock;

        explicit Endpoint(std::string url,
                          Protocol protocol = Protocol::kHTTPS,
                          EndpointStatus status = {});

        // Url of the mirror. Also used as the identifier when merging directories.
        const std::string& url() const noexcept
        {
            return m_url;
        }

        Protocol protocol() const noexcept
        {
            return m_protocol;
        }

        const EndpointStatus& status() const noexcept
        {
            return m_status;
        }

        const std::optional<double>& score() const noexcept
        {
            return m_status.score;
        }

        const std::optional<double>& delay() const noexcept
        {
            return m_status.delay;
        }

        const std::optional<std::string>& country() const noexcept
        {
            return m_status.country;
        }

        const std::optional<std::string>& country_code() const noexcept
        {
            return m_status.country_code;
        }

        const std::optional<clock::time_point>& last_sync() const noexcept
        {
            return m_status.last_sync;
        }

        const std::string& details() const noexcept
        {
            return m_status.details;
        }

        bool has_isos() const noexcept
        {
            return m_status.isos.value_or(false);
        }

        bool has_ipv4() const noexcept
        {
            return m_status.ipv4.value_or(false);
        }

        bool has_ipv6() const noexcept
        {
            return m_status.ipv6.value_or(false);
        }

        // Measured download rate in kB/s. Unset until a probe succeeded, NaN when the probe
        // succeeded without receiving any byte.
        const std::optional<double>& download_rate() const noexcept
        {
            return m_download_rate;
        }

        // Returns a copy of this endpoint carrying the given measured rate.
        Endpoint with_download_rate(double rate) const;

        // Time elapsed since the last synchronisation, negative if the mirror reports a
        // synchronisation in the future. Undefined without a last synchronisation.
        std::optional<clock::duration> age(clock::time_point now = clock::now()) const;

        // Full url of `path` on this mirror.
        std::string resource_url(const std::string& path) const;

        std::string to_string() const;

    private:
        std::string m_url;
        Protocol m_protocol;
        EndpointStatus m_status;

        std::optional<double> m_download_rate;
    };
}

#endif
