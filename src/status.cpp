#include <stdexcept>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <mirrorrank/context.hpp>
#include <mirrorrank/status.hpp>
#include <mirrorrank/utils.hpp>

#include "curl_internal.hpp"

namespace mirrorrank
{
    namespace
    {
        MirrorError malformed(const std::string& reason)
        {
            return MirrorError{ ErrorLevel::FATAL, ErrorCode::MR_MALFORMED_INPUT, reason };
        }

        // Missing and `null` fields are both unknown values.
        const nlohmann::json* find_field(const nlohmann::json& entry, const char* key)
        {
            auto it = entry.find(key);
            if (it == entry.end() || it->is_null())
                return nullptr;
            return &(*it);
        }

        std::optional<double> optional_number(const nlohmann::json& entry, const char* key)
        {
            const nlohmann::json* field = find_field(entry, key);
            if (!field)
                return std::nullopt;
            if (!field->is_number())
                throw std::invalid_argument(fmt::format("field '{}' must be a number", key));
            return field->get<double>();
        }

        std::optional<std::string> optional_string(const nlohmann::json& entry, const char* key)
        {
            const nlohmann::json* field = find_field(entry, key);
            if (!field)
                return std::nullopt;
            if (!field->is_string())
                throw std::invalid_argument(fmt::format("field '{}' must be a string", key));
            return field->get<std::string>();
        }

        std::optional<bool> optional_bool(const nlohmann::json& entry, const char* key)
        {
            const nlohmann::json* field = find_field(entry, key);
            if (!field)
                return std::nullopt;
            if (!field->is_boolean())
                throw std::invalid_argument(fmt::format("field '{}' must be a boolean", key));
            return field->get<bool>();
        }
    }

    tl::expected<Endpoint, MirrorError> endpoint_from_json(const nlohmann::json& entry)
    {
        if (!entry.is_object())
            return tl::unexpected(malformed("mirror entry must be an object"));

        try
        {
            std::optional<std::string> url = optional_string(entry, "url");
            if (!url)
                return tl::unexpected(malformed("mirror entry without url"));

            Protocol protocol = Protocol::kHTTPS;
            if (auto name = optional_string(entry, "protocol"))
            {
                auto parsed = protocol_from_string(name.value());
                if (!parsed)
                    return tl::unexpected(
                        malformed(fmt::format("mirror {}: {}", url.value(), parsed.error())));
                protocol = parsed.value();
            }

            EndpointStatus status;
            status.score = optional_number(entry, "score");
            status.delay = optional_number(entry, "delay");
            status.country = optional_string(entry, "country");
            status.country_code = optional_string(entry, "country_code");
            status.isos = optional_bool(entry, "isos");
            status.ipv4 = optional_bool(entry, "ipv4");
            status.ipv6 = optional_bool(entry, "ipv6");
            status.details = optional_string(entry, "details").value_or(std::string());

            if (auto last_sync = optional_string(entry, "last_sync"))
            {
                status.last_sync = parse_rfc3339(last_sync.value());
                if (!status.last_sync)
                {
                    return tl::unexpected(malformed(fmt::format(
                        "mirror {}: invalid last_sync '{}'", url.value(), last_sync.value())));
                }
            }

            return Endpoint(std::move(url.value()), protocol, std::move(status));
        }
        catch (const std::invalid_argument& e)
        {
            return tl::unexpected(malformed(e.what()));
        }
        catch (const nlohmann::json::exception& e)
        {
            return tl::unexpected(malformed(e.what()));
        }
    }

    tl::expected<Directory, MirrorError> directory_from_json(const nlohmann::json& document,
                                                             std::optional<std::string> source)
    {
        if (!document.is_object())
            return tl::unexpected(malformed("mirror status must be a JSON object"));

        auto urls = document.find("urls");
        if (urls == document.end() || !urls->is_array())
            return tl::unexpected(malformed("mirror status without 'urls' array"));

        if (!source)
        {
            auto src = document.find("source");
            if (src != document.end() && src->is_string())
                source = src->get<std::string>();
        }

        endpoint_list endpoints;
        endpoints.reserve(urls->size());
        for (const auto& entry : *urls)
        {
            auto endpoint = endpoint_from_json(entry);
            if (!endpoint)
                return tl::unexpected(endpoint.error());
            endpoints.push_back(std::move(endpoint.value()));
        }
        return Directory(std::move(endpoints), std::move(source));
    }

    tl::expected<Directory, MirrorError> parse_directory(const std::string& body,
                                                         std::optional<std::string> source)
    {
        nlohmann::json document;
        try
        {
            document = nlohmann::json::parse(body);
        }
        catch (const nlohmann::json::parse_error& e)
        {
            return tl::unexpected(malformed(fmt::format("malformed JSON: {}", e.what())));
        }
        return directory_from_json(document, std::move(source));
    }

    tl::expected<Directory, MirrorError> fetch_directory(const Context& ctx,
                                                         const std::string& url)
    {
        spdlog::info("Fetching mirror status from {}", url);
        Response response;
        try
        {
            CURLHandle h(ctx, url);
            h.accept_encoding();
            response = h.perform();
        }
        catch (const curl_error& e)
        {
            return tl::unexpected(MirrorError{
                ErrorLevel::FATAL,
                e.code() == CURLE_OPERATION_TIMEDOUT ? ErrorCode::MR_TIMEOUT : ErrorCode::MR_CURL,
                fmt::format("Could not fetch mirror status from {}: {}", url, e.what()) });
        }

        if (!response.ok())
        {
            return tl::unexpected(MirrorError{
                ErrorLevel::FATAL,
                ErrorCode::MR_BADSTATUS,
                fmt::format("Could not fetch mirror status from {}: HTTP status {}",
                            url,
                            response.http_status) });
        }

        spdlog::debug("Received {} bytes of mirror status", response.downloaded_size);
        if (auto modified = response.get_header("last-modified"))
        {
            spdlog::debug("Mirror status last modified {}", modified.value());
        }

        nlohmann::json document;
        try
        {
            document = response.json();
        }
        catch (const nlohmann::json::parse_error& e)
        {
            return tl::unexpected(malformed(fmt::format("malformed JSON: {}", e.what())));
        }

        auto directory = directory_from_json(document, url);
        if (directory)
            spdlog::info("Fetched {} mirrors from {}", directory->size(), url);
        return directory;
    }

    tl::expected<Directory, MirrorError> fetch_directory(const Context& ctx)
    {
        return fetch_directory(ctx, ctx.status_url);
    }
}
