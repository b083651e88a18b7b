#include <fmt/format.h>

#include <mirrorrank/endpoint.hpp>
#include <mirrorrank/utils.hpp>

namespace mirrorrank
{
    Endpoint::Endpoint(std::string url, Protocol protocol, EndpointStatus status)
        : m_url(std::move(url))
        , m_protocol(protocol)
        , m_status(std::move(status))
    {
    }

    Endpoint Endpoint::with_download_rate(double rate) const
    {
        Endpoint updated(*this);
        updated.m_download_rate = rate;
        return updated;
    }

    std::optional<Endpoint::clock::duration> Endpoint::age(clock::time_point now) const
    {
        if (!m_status.last_sync)
            return std::nullopt;
        return now - m_status.last_sync.value();
    }

    std::string Endpoint::resource_url(const std::string& path) const
    {
        return join_url(m_url, path);
    }

    std::string Endpoint::to_string() const
    {
        return fmt::format("Endpoint <{} [{}]>", m_url, mirrorrank::to_string(m_protocol));
    }
}
