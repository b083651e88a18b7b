#ifndef MIRRORRANK_CURL_HPP
#define MIRRORRANK_CURL_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <mirrorrank/export.hpp>

namespace mirrorrank
{
    class CURLHandle;

    struct MIRRORRANK_API Response
    {
        std::map<std::string, std::string> headers;

        long http_status = 0;
        std::string effective_url;

        // 2xx for http(s), anything for protocols without status (file://, ftp:// reports 2xx
        // or 0 on success)
        bool ok() const;

        tl::expected<std::string, std::out_of_range> get_header(const std::string& header) const;

        void fill_values(CURLHandle& handle);

        // Only filled when the transfer used the default callbacks (`CURLHandle::perform`).
        std::optional<std::string> content;
        nlohmann::json json() const;

        curl_off_t downloaded_size = -1;
    };
}

#endif
