#ifndef MIRRORRANK_ENUMS_HPP
#define MIRRORRANK_ENUMS_HPP

#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include <mirrorrank/export.hpp>

namespace mirrorrank
{
    // Transport protocols a mirror can be reached with.
    enum class Protocol
    {
        kFTP,
        kHTTPS,
        kHTTP,
        kRSYNC,
    };

    // Keys a directory can be ranked by.
    enum class SortKey
    {
        // Last server synchronisation
        kAGE,
        // Measured download rate
        kRATE,
        // Country name, alphabetically
        kCOUNTRY,
        // Mirror status score. The lower, the better
        kSCORE,
        // Mirror status delay
        kDELAY,
    };

    enum class ErrorCode
    {
        // everything is ok
        MR_OK,
        // bad function argument
        MR_BADFUNCARG,
        // cURL doesn't know the option. Too old curl version?
        MR_CURLSETOPT,
        // cURL error while transferring (connection refused, DNS, HTTP status >= 400, ...)
        MR_CURL,
        // the transfer did not finish before its deadline
        MR_TIMEOUT,
        // the transfer was abandoned by its owner
        MR_CANCELLED,
        // HTTP returned a status code which does not represent success
        MR_BADSTATUS,
        // the mirror status document could not be decoded
        MR_MALFORMED_INPUT,
        // input output error
        MR_IO,
        // (xx) unknown error - sentinel of error codes enum
        MR_UNKNOWNERROR,
    };

    enum ErrorLevel
    {
        INFO,
        SERIOUS,
        FATAL
    };

    MIRRORRANK_API std::string to_string(Protocol protocol);
    MIRRORRANK_API std::string to_string(SortKey key);

    MIRRORRANK_API tl::expected<Protocol, std::string> protocol_from_string(std::string_view name);
    MIRRORRANK_API tl::expected<SortKey, std::string> sort_key_from_string(std::string_view name);
}

#endif
