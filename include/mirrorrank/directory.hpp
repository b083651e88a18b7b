#ifndef MIRRORRANK_DIRECTORY_HPP
#define MIRRORRANK_DIRECTORY_HPP

#include <optional>
#include <string>
#include <vector>

#include <mirrorrank/export.hpp>
#include <mirrorrank/endpoint.hpp>

namespace mirrorrank
{
    using endpoint_list = std::vector<Endpoint>;

    // Ordered collection of endpoints and where they came from.
    class MIRRORRANK_API Directory
    {
    public:
        Directory() = default;
        explicit Directory(endpoint_list endpoints,
                           std::optional<std::string> source = std::nullopt);

        const endpoint_list& endpoints() const noexcept
        {
            return m_endpoints;
        }

        // Moves the endpoint sequence out of the directory, leaving it empty.
        endpoint_list take_endpoints() noexcept;

        const std::optional<std::string>& source() const noexcept
        {
            return m_source;
        }

        void set_source(std::optional<std::string> source)
        {
            m_source = std::move(source);
        }

        std::size_t size() const noexcept
        {
            return m_endpoints.size();
        }

        bool empty() const noexcept
        {
            return m_endpoints.empty();
        }

        const Endpoint& operator[](std::size_t i) const
        {
            return m_endpoints[i];
        }

        endpoint_list::const_iterator begin() const noexcept
        {
            return m_endpoints.begin();
        }

        endpoint_list::const_iterator end() const noexcept
        {
            return m_endpoints.end();
        }

        void push_back(Endpoint endpoint);

        // Keeps at most `count` endpoints, from the front.
        void truncate(std::size_t count);

    private:
        endpoint_list m_endpoints;
        std::optional<std::string> m_source;
    };
}

#endif
