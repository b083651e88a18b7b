#include <mirrorrank/directory.hpp>

namespace mirrorrank
{
    Directory::Directory(endpoint_list endpoints, std::optional<std::string> source)
        : m_endpoints(std::move(endpoints))
        , m_source(std::move(source))
    {
    }

    endpoint_list Directory::take_endpoints() noexcept
    {
        endpoint_list result;
        result.swap(m_endpoints);
        return result;
    }

    void Directory::push_back(Endpoint endpoint)
    {
        m_endpoints.push_back(std::move(endpoint));
    }

    void Directory::truncate(std::size_t count)
    {
        if (count < m_endpoints.size())
        {
            m_endpoints.erase(m_endpoints.begin() + static_cast<std::ptrdiff_t>(count),
                              m_endpoints.end());
        }
    }
}
