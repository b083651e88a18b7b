#include <fmt/format.h>

#include <mirrorrank/enums.hpp>
#include <mirrorrank/utils.hpp>

namespace mirrorrank
{
    std::string to_string(Protocol protocol)
    {
        switch (protocol)
        {
            case Protocol::kFTP:
                return "ftp";
            case Protocol::kHTTPS:
                return "https";
            case Protocol::kHTTP:
                return "http";
            case Protocol::kRSYNC:
                return "rsync";
        }
        return "unknown";
    }

    std::string to_string(SortKey key)
    {
        switch (key)
        {
            case SortKey::kAGE:
                return "age";
            case SortKey::kRATE:
                return "rate";
            case SortKey::kCOUNTRY:
                return "country";
            case SortKey::kSCORE:
                return "score";
            case SortKey::kDELAY:
                return "delay";
        }
        return "unknown";
    }

    tl::expected<Protocol, std::string> protocol_from_string(std::string_view name)
    {
        const std::string lname = to_lower(name);
        if (lname == "ftp")
            return Protocol::kFTP;
        if (lname == "https")
            return Protocol::kHTTPS;
        if (lname == "http")
            return Protocol::kHTTP;
        if (lname == "rsync")
            return Protocol::kRSYNC;
        return tl::unexpected(fmt::format("unknown protocol '{}'", name));
    }

    tl::expected<SortKey, std::string> sort_key_from_string(std::string_view name)
    {
        const std::string lname = to_lower(name);
        if (lname == "age")
            return SortKey::kAGE;
        if (lname == "rate")
            return SortKey::kRATE;
        if (lname == "country")
            return SortKey::kCOUNTRY;
        if (lname == "score")
            return SortKey::kSCORE;
        if (lname == "delay")
            return SortKey::kDELAY;
        return tl::unexpected(fmt::format("unknown sort key '{}'", name));
    }
}
