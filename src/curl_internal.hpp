#ifndef MIRRORRANK_SRC_CURL_INTERNAL_HPP
#define MIRRORRANK_SRC_CURL_INTERNAL_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/core.h>

#include <mirrorrank/export.hpp>
#include <mirrorrank/utils.hpp>
#include <mirrorrank/curl.hpp>

namespace mirrorrank
{
    class Context;

    class MIRRORRANK_API curl_error : public std::runtime_error
    {
    public:
        curl_error(const std::string& what = "download error", CURLcode code = CURLE_OK);
        CURLcode code() const;

    private:
        CURLcode m_code;
    };

    class MIRRORRANK_API CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        CURLHandle(const Context& ctx, const std::string& url);
        ~CURLHandle();

        CURLHandle& url(const std::string& url);
        CURLHandle& accept_encoding();
        CURLHandle& user_agent(const std::string& user_agent);

        // Limits the whole transfer (connection included) to `timeout`.
        CURLHandle& timeout(std::chrono::milliseconds timeout);

        // Aborts the running transfer (CURLE_ABORTED_BY_CALLBACK) as soon as `*flag` is set.
        // `flag` must outlive the transfer.
        CURLHandle& abort_on(const std::atomic<bool>* flag);

        // Runs the transfer with the default callbacks filling a `Response`.
        // Throws a `curl_error` if the transfer fails.
        Response perform();

        // Runs the transfer with whatever callbacks are set and returns the curl result.
        CURLcode perform_raw();

        // Human readable description of `code`, including the details curl wrote in its
        // error buffer.
        std::string error_message(CURLcode code) const;

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        // This is made public because it is used internally in quite some files
        CURL* handle();

        CURLHandle& add_header(const std::string& header);
        CURLHandle& add_headers(const std::vector<std::string>& headers);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

        void set_default_callbacks();

        // The error buffer address is registered in the handle.
        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

    private:
        void init_handle(const Context& ctx);
        void finalize_transfer(Response& response);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char errorbuffer[CURL_ERROR_SIZE];

        std::unique_ptr<Response> response;
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)), ok);
        }
        return *this;
    }
}

namespace mirrorrank::details
{
    // Scoped initialization and termination of CURL.
    // This should never have more than one instance live at any time,
    // this object's constructor will throw an `std::runtime_error` if it's the case.
    class CURLSetup final
    {
    public:
        CURLSetup();
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif
