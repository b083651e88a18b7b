#include <atomic>

#include <spdlog/spdlog.h>

#include <mirrorrank/curl.hpp>
#include <mirrorrank/utils.hpp>
#include <mirrorrank/context.hpp>

#include "curl_internal.hpp"

namespace mirrorrank
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what, CURLcode code)
        : std::runtime_error(what)
        , m_code(code)
    {
    }

    CURLcode curl_error::code() const
    {
        return m_code;
    }

    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        init_handle(ctx);
        // Set error buffer
        errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, errorbuffer);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_NETRC, static_cast<long>(CURL_NETRC_OPTIONAL));
        setopt(CURLOPT_MAXREDIRS, 6L);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);
        // Several handles live on different threads: signals can't be used for timeouts
        setopt(CURLOPT_NOSIGNAL, 1L);

        if (ctx.disable_ssl)
        {
            spdlog::warn("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            // Windows SSL backend doesn't support this
            CURLcode verifystatus = curl_easy_setopt(m_handle, CURLOPT_SSL_VERIFYSTATUS, 0L);
            if (verifystatus != CURLE_OK && verifystatus != CURLE_NOT_BUILT_IN)
                throw curl_error("Could not initialize CURL handle", verifystatus);

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }

        }

        if (!ctx.user_agent.empty())
            user_agent(ctx.user_agent);
        add_headers(ctx.additional_httpheaders);

        if (ctx.verbosity > 1)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : CURLHandle(ctx)
    {
        this->url(url);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url)
    {
        setopt(CURLOPT_URL, url);
        return *this;
    }

    CURLHandle& CURLHandle::accept_encoding()
    {
        setopt(CURLOPT_ACCEPT_ENCODING, "");
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        add_header(fmt::format("User-Agent: {} {}", user_agent, curl_version()));
        return *this;
    }

    CURLHandle& CURLHandle::timeout(std::chrono::milliseconds timeout)
    {
        setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        return *this;
    }

    namespace
    {
        int abort_flag_callback(void* flag,
                                curl_off_t /*total_to_download*/,
                                curl_off_t /*now_downloaded*/,
                                curl_off_t /*total_to_upload*/,
                                curl_off_t /*now_uploaded*/)
        {
            // any non-zero value aborts the transfer
            return static_cast<const std::atomic<bool>*>(flag)->load() ? 1 : 0;
        }
    }

    CURLHandle& CURLHandle::abort_on(const std::atomic<bool>* flag)
    {
        setopt(CURLOPT_XFERINFOFUNCTION, &abort_flag_callback);
        setopt(CURLOPT_XFERINFODATA, static_cast<void*>(const_cast<std::atomic<bool>*>(flag)));
        setopt(CURLOPT_NOPROGRESS, 0L);
        return *this;
    }

    Response CURLHandle::perform()
    {
        set_default_callbacks();
        CURLcode curl_result = perform_raw();
        if (curl_result != CURLE_OK)
        {
            throw curl_error(error_message(curl_result), curl_result);
        }
        finalize_transfer(*response);
        Response result = std::move(*response);
        response.reset();
        return result;
    }

    CURLcode CURLHandle::perform_raw()
    {
        errorbuffer[0] = '\0';
        return curl_easy_perform(handle());
    }

    std::string CURLHandle::error_message(CURLcode code) const
    {
        return fmt::format("{} [{}]", curl_easy_strerror(code), errorbuffer);
    }

    void CURLHandle::finalize_transfer(Response& lresponse)
    {
        lresponse.fill_values(*this);
        if (!lresponse.ok())
        {
            spdlog::error("Received {}: {}",
                          lresponse.http_status,
                          lresponse.content.value_or(std::string()));
        }
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<char*, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (!res)
            return tl::unexpected(res.error());
        if (res.value() == nullptr)
            return std::string();
        return std::string(res.value());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    namespace
    {
        template <class T>
        std::size_t string_callback(char* buffer, std::size_t size, std::size_t nitems, T* string)
        {
            string->append(buffer, size * nitems);
            return size * nitems;
        }

        template <class T>
        std::size_t header_map_callback(char* buffer,
                                        std::size_t size,
                                        std::size_t nitems,
                                        T* header_map)
        {
            auto kv = parse_header(std::string_view(buffer, size * nitems));
            if (!kv.first.empty())
            {
                (*header_map)[kv.first] = kv.second;
            }
            return size * nitems;
        }
    }

    void CURLHandle::set_default_callbacks()
    {
        response.reset(new Response);
        setopt(CURLOPT_HEADERFUNCTION, header_map_callback<std::map<std::string, std::string>>);
        setopt(CURLOPT_HEADERDATA, &response->headers);

        setopt(CURLOPT_WRITEFUNCTION, string_callback<std::string>);
        response->content = std::string();
        setopt(CURLOPT_WRITEDATA, &response->content.value());
    }

    /************
     * Response *
     ************/

    bool Response::ok() const
    {
        // protocols without status codes (file://) report 0
        return http_status == 0 || http_status / 100 == 2;
    }

    tl::expected<std::string, std::out_of_range> Response::get_header(
        const std::string& header) const
    {
        if (headers.find(header) != headers.end())
            return headers.at(header);
        else
            return tl::unexpected(
                std::out_of_range(std::string("Could not find header ") + header));
    }

    nlohmann::json Response::json() const
    {
        try
        {
            return nlohmann::json::parse(content.value());
        }
        catch (const nlohmann::json::parse_error& e)
        {
            spdlog::error("Could not parse JSON from {}", effective_url);
            spdlog::error("Error message: {}", e.what());
            throw;
        }
    }

    void Response::fill_values(CURLHandle& handle)
    {
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
        downloaded_size = handle.getinfo<curl_off_t>(CURLINFO_SIZE_DOWNLOAD_T).value_or(-1);
    }

    namespace details
    {
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup()
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "mirrorrank::CURLSetup created more than once - instance must be unique");
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}
