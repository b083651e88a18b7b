#include <chrono>

#include <doctest/doctest.h>

#include <mirrorrank/enums.hpp>
#include <mirrorrank/utils.hpp>

using namespace mirrorrank;
using namespace std::chrono_literals;

TEST_SUITE("utility")
{
    TEST_CASE("parse_rfc3339")
    {
        auto tp = parse_rfc3339("2024-05-01T14:25:08Z");
        REQUIRE(tp.has_value());
        CHECK_EQ(std::chrono::system_clock::to_time_t(tp.value()), 1714573508);

        auto epoch = parse_rfc3339("1970-01-01T00:00:00Z");
        REQUIRE(epoch.has_value());
        CHECK_EQ(epoch.value().time_since_epoch().count(), 0);
    }

    TEST_CASE("parse_rfc3339_offset_and_fraction")
    {
        auto utc = parse_rfc3339("2024-05-01T14:25:08Z");
        auto offset = parse_rfc3339("2024-05-01T16:25:08+02:00");
        auto negative = parse_rfc3339("2024-05-01T13:55:08-00:30");
        REQUIRE(utc.has_value());
        CHECK_EQ(offset, utc);
        CHECK_EQ(negative, utc);

        auto fraction = parse_rfc3339("2024-05-01T14:25:08.250Z");
        REQUIRE(fraction.has_value());
        CHECK_EQ(fraction.value() - utc.value(), 250ms);

        // leap day
        CHECK(parse_rfc3339("2024-02-29T00:00:00Z").has_value());
    }

    TEST_CASE("parse_rfc3339_invalid")
    {
        CHECK_FALSE(parse_rfc3339("").has_value());
        CHECK_FALSE(parse_rfc3339("yesterday").has_value());
        CHECK_FALSE(parse_rfc3339("2024-05-01").has_value());
        CHECK_FALSE(parse_rfc3339("2024-05-01T14:25:08").has_value());
        CHECK_FALSE(parse_rfc3339("2024-13-01T14:25:08Z").has_value());
        CHECK_FALSE(parse_rfc3339("2023-02-29T14:25:08Z").has_value());
        CHECK_FALSE(parse_rfc3339("2024-05-01T24:25:08Z").has_value());
        CHECK_FALSE(parse_rfc3339("2024-05-01T14:25:08.Z").has_value());
        CHECK_FALSE(parse_rfc3339("2024-05-01T14:25:08+0200").has_value());
        CHECK_FALSE(parse_rfc3339("2024-05-01T14:25:08Zjunk").has_value());
    }

    TEST_CASE("join_url")
    {
        CHECK_EQ(join_url("https://mirror.org/archlinux/", "extra/os/x86_64/extra.db"),
                 "https://mirror.org/archlinux/extra/os/x86_64/extra.db");
        CHECK_EQ(join_url("https://mirror.org/archlinux", "/extra.db"),
                 "https://mirror.org/archlinux/extra.db");
        CHECK_EQ(join_url("https://mirror.org//", "//extra.db"), "https://mirror.org/extra.db");
        CHECK_EQ(join_url("", "extra.db"), "extra.db");
        CHECK_EQ(join_url("https://mirror.org/", ""), "https://mirror.org/");
    }

    TEST_CASE("utf8_length")
    {
        CHECK_EQ(utf8_length(""), 0);
        CHECK_EQ(utf8_length("Greece"), 6);
        CHECK_EQ(utf8_length("Türkiye"), 7);
        CHECK_EQ(utf8_length("Réunion"), 7);
        CHECK_EQ(utf8_length("日本"), 2);
    }

    TEST_CASE("parse_header")
    {
        CHECK_EQ(to_lower("HTTPS"), "https");

        auto [key, value] = parse_header("Content-Length: 1234\r\n");
        CHECK_EQ(key, "content-length");
        CHECK_EQ(value, "1234");

        auto [no_key, line] = parse_header("HTTP/1.1 200 OK\r\n");
        CHECK_EQ(no_key, "");
        CHECK_EQ(line, "HTTP/1.1 200 OK\r\n");
    }

    TEST_CASE("protocol_names")
    {
        for (Protocol p : { Protocol::kFTP, Protocol::kHTTPS, Protocol::kHTTP, Protocol::kRSYNC })
        {
            auto parsed = protocol_from_string(to_string(p));
            REQUIRE(parsed.has_value());
            CHECK_EQ(parsed.value(), p);
        }
        CHECK_EQ(protocol_from_string("HTTPS").value(), Protocol::kHTTPS);
        CHECK_FALSE(protocol_from_string("gopher").has_value());
        CHECK_EQ(protocol_from_string("gopher").error(), "unknown protocol 'gopher'");
    }

    TEST_CASE("sort_key_names")
    {
        CHECK_EQ(sort_key_from_string("age").value(), SortKey::kAGE);
        CHECK_EQ(sort_key_from_string("Rate").value(), SortKey::kRATE);
        CHECK_EQ(sort_key_from_string("country").value(), SortKey::kCOUNTRY);
        CHECK_EQ(sort_key_from_string("score").value(), SortKey::kSCORE);
        CHECK_EQ(sort_key_from_string("delay").value(), SortKey::kDELAY);
        CHECK_FALSE(sort_key_from_string("speed").has_value());
        CHECK_EQ(to_string(SortKey::kRATE), "rate");
    }
}
