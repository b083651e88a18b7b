#ifndef MIRRORRANK_CONTEXT_HPP
#define MIRRORRANK_CONTEXT_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <mirrorrank/export.hpp>
#include <mirrorrank/curl.hpp>

namespace mirrorrank
{
    namespace fs = std::filesystem;

    inline constexpr const char* MIRROR_STATUS_URL = "https://archlinux.org/mirrors/status/json";
    inline constexpr const char* PROBE_RESOURCE_PATH = "extra/os/x86_64/extra.db";

    class MIRRORRANK_API Context
    {
    public:
        int verbosity = 0;

        // ssl options
        bool disable_ssl = false;
        fs::path ssl_ca_info;

        long connect_timeout = 30L;
        long low_speed_time = 30L;
        long low_speed_limit = 1000L;

        // This can improve throughput significantly
        // see https://github.com/curl/curl/issues/9601
        long transfer_buffersize = 100 * 1024;

        std::string user_agent = "mirrorrank";

        // Where the mirror status document is fetched from.
        std::string status_url = MIRROR_STATUS_URL;

        // Resource downloaded from every probed mirror, relative to the mirror url.
        std::string probe_path = PROBE_RESOURCE_PATH;

        // Extra "Name: value" headers sent with every request.
        std::vector<std::string> additional_httpheaders;

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);

        // Throws if another instance already exists: there can only be one at any time!
        Context();
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;  // Private implementation details
    };

}

#endif
