#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorrank/options.hpp>

namespace mirrorrank
{
    probe_deadline Options::deadline() const
    {
        if (probe_timeout <= 0)
            return std::nullopt;
        return std::chrono::seconds(probe_timeout);
    }

    namespace
    {
        template <class T>
        T read_value(const YAML::Node& node, const char* key)
        {
            try
            {
                return node[key].as<T>();
            }
            catch (const YAML::Exception& e)
            {
                throw std::invalid_argument(
                    fmt::format("invalid value for '{}': {}", key, e.what()));
            }
        }

        std::size_t read_count(const YAML::Node& node, const char* key)
        {
            const long value = read_value<long>(node, key);
            if (value < 0)
                throw std::invalid_argument(fmt::format("'{}' must not be negative", key));
            return static_cast<std::size_t>(value);
        }
    }

    void load_options(const YAML::Node& node, Options& options)
    {
        if (!node || node.IsNull())
            return;
        if (!node.IsMap())
            throw std::invalid_argument("configuration must be a mapping");

        if (node["url"])
            options.url = read_value<std::string>(node, "url");
        if (node["number"])
            options.number = read_count(node, "number");
        if (node["sort"])
        {
            auto key = sort_key_from_string(read_value<std::string>(node, "sort"));
            if (!key)
                throw std::invalid_argument(key.error());
            options.sort = key.value();
        }
        if (node["age"])
            options.criteria.max_age_hours = read_value<double>(node, "age");
        if (node["isos"])
            options.criteria.isos = read_value<bool>(node, "isos");
        if (node["ipv4"])
            options.criteria.ipv4 = read_value<bool>(node, "ipv4");
        if (node["ipv6"])
            options.criteria.ipv6 = read_value<bool>(node, "ipv6");
        if (node["protocols"])
        {
            options.criteria.protocols.clear();
            for (const auto& name : read_value<std::vector<std::string>>(node, "protocols"))
            {
                auto protocol = protocol_from_string(name);
                if (!protocol)
                    throw std::invalid_argument(protocol.error());
                options.criteria.protocols.push_back(protocol.value());
            }
        }
        if (node["timeout"])
            options.probe_timeout = read_value<long>(node, "timeout");
        if (node["probe_count"])
            options.probe_count = read_count(node, "probe_count");
        if (node["save"])
            options.save = read_value<std::string>(node, "save");
        if (node["headers"])
            options.headers = read_value<std::vector<std::string>>(node, "headers");
        if (node["cacert"])
            options.cacert = read_value<std::string>(node, "cacert");
    }

    void load_options(const fs::path& path, Options& options)
    {
        spdlog::info("Loading configuration {}", path.string());
        YAML::Node node;
        try
        {
            node = YAML::LoadFile(path.string());
        }
        catch (const YAML::Exception& e)
        {
            throw std::invalid_argument(
                fmt::format("could not load configuration {}: {}", path.string(), e.what()));
        }
        load_options(node, options);
    }

    void configure_context(const Options& options, Context& ctx)
    {
        for (const auto& header : options.headers)
        {
            const auto colon = header.find(':');
            if (colon == 0 || colon == std::string::npos)
                throw std::invalid_argument(
                    fmt::format("invalid header '{}', expected 'Name: value'", header));
        }
        ctx.additional_httpheaders.insert(
            ctx.additional_httpheaders.end(), options.headers.begin(), options.headers.end());

        if (!options.cacert.empty())
        {
            spdlog::debug("Using certificate bundle {}", options.cacert.string());
            ctx.ssl_ca_info = options.cacert;
        }
    }
}
