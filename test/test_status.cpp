#include <doctest/doctest.h>

#include <mirrorrank/context.hpp>
#include <mirrorrank/status.hpp>
#include <mirrorrank/utils.hpp>

#include "test_helpers.hpp"

using namespace mirrorrank;

namespace
{
    const char* MIRROR_NTUA = R"({
        "url": "http://ftp.ntua.gr/pub/linux/archlinux/",
        "protocol": "http",
        "last_sync": "2024-05-01T14:25:08Z",
        "completion_pct": 1.0,
        "delay": 6354,
        "duration_avg": 0.4358575581256008,
        "duration_stddev": 0.6512862688716142,
        "score": 2.852143826997215,
        "active": true,
        "country": "Greece",
        "country_code": "GR",
        "isos": true,
        "ipv4": true,
        "ipv6": true,
        "details": "https://archlinux.org/mirrors/ntua.gr/333/"
    })";
}

TEST_SUITE("status")
{
    TEST_CASE("endpoint_from_json")
    {
        auto endpoint = endpoint_from_json(nlohmann::json::parse(MIRROR_NTUA));
        REQUIRE(endpoint.has_value());
        CHECK_EQ(endpoint->url(), "http://ftp.ntua.gr/pub/linux/archlinux/");
        CHECK_EQ(endpoint->protocol(), Protocol::kHTTP);
        CHECK_EQ(endpoint->last_sync(), parse_rfc3339("2024-05-01T14:25:08Z"));
        CHECK_EQ(endpoint->delay(), 6354.0);
        CHECK_EQ(endpoint->score().value(), doctest::Approx(2.852143826997215));
        CHECK_EQ(endpoint->country(), std::optional<std::string>("Greece"));
        CHECK_EQ(endpoint->country_code(), std::optional<std::string>("GR"));
        CHECK(endpoint->has_isos());
        CHECK(endpoint->has_ipv4());
        CHECK(endpoint->has_ipv6());
        CHECK_EQ(endpoint->details(), "https://archlinux.org/mirrors/ntua.gr/333/");
        CHECK_FALSE(endpoint->download_rate().has_value());
    }

    TEST_CASE("endpoint_defaults")
    {
        auto endpoint
            = endpoint_from_json(nlohmann::json{ { "url", "https://mirror.org/" },
                                                 { "score", nullptr },
                                                 { "isos", nullptr } });
        REQUIRE(endpoint.has_value());
        CHECK_EQ(endpoint->protocol(), Protocol::kHTTPS);
        CHECK_FALSE(endpoint->score().has_value());
        CHECK_FALSE(endpoint->delay().has_value());
        CHECK_FALSE(endpoint->last_sync().has_value());
        CHECK_FALSE(endpoint->status().isos.has_value());
        CHECK_FALSE(endpoint->status().ipv6.has_value());
        CHECK_EQ(endpoint->details(), "");
    }

    TEST_CASE("endpoint_errors")
    {
        auto check_malformed = [](const nlohmann::json& entry)
        {
            auto endpoint = endpoint_from_json(entry);
            REQUIRE_FALSE(endpoint.has_value());
            CHECK_EQ(endpoint.error().code, ErrorCode::MR_MALFORMED_INPUT);
            CHECK(endpoint.error().is_fatal());
        };

        check_malformed(nlohmann::json::array());
        check_malformed(nlohmann::json{ { "protocol", "https" } });
        check_malformed(nlohmann::json{ { "url", nullptr } });
        check_malformed(nlohmann::json{ { "url", 42 } });
        check_malformed(nlohmann::json{ { "url", "gopher://a.org/" }, { "protocol", "gopher" } });
        check_malformed(nlohmann::json{ { "url", "https://a.org/" }, { "last_sync", "yesterday" } });
        check_malformed(nlohmann::json{ { "url", "https://a.org/" }, { "delay", "slow" } });
        check_malformed(nlohmann::json{ { "url", "https://a.org/" }, { "ipv4", 1 } });
    }

    TEST_CASE("parse_directory")
    {
        auto directory = parse_directory(test::read_file(test::testdata("status.json")));
        REQUIRE(directory.has_value());
        CHECK_EQ(directory->size(), 5);
        CHECK_FALSE(directory->source().has_value());
        CHECK_EQ((*directory)[4].protocol(), Protocol::kRSYNC);
        CHECK_EQ((*directory)[3].country(), std::optional<std::string>(""));
        CHECK_FALSE((*directory)[0].last_sync().has_value());
    }

    TEST_CASE("parse_directory_source")
    {
        const std::string body
            = R"({"source": "mirror status", "urls": [{"url": "https://a.org/"}]})";

        auto from_document = parse_directory(body);
        REQUIRE(from_document.has_value());
        CHECK_EQ(from_document->source(), std::optional<std::string>("mirror status"));

        auto overridden = parse_directory(body, std::string("https://example.org/json"));
        REQUIRE(overridden.has_value());
        CHECK_EQ(overridden->source(), std::optional<std::string>("https://example.org/json"));
    }

    TEST_CASE("parse_directory_errors")
    {
        for (const char* body : { "",
                                  "{",
                                  "[]",
                                  R"({"cutoff": 86400})",
                                  R"({"urls": {}})",
                                  R"({"urls": [{"url": "https://a.org/"}, {"protocol": "http"}]})" })
        {
            CAPTURE(body);
            auto directory = parse_directory(body);
            REQUIRE_FALSE(directory.has_value());
            CHECK_EQ(directory.error().code, ErrorCode::MR_MALFORMED_INPUT);
            CHECK(directory.error().is_fatal());
        }

        auto empty = parse_directory(R"({"urls": []})");
        REQUIRE(empty.has_value());
        CHECK(empty->empty());
    }

    TEST_CASE("fetch_directory")
    {
        Context ctx;
        const std::string url = "file://" + test::testdata("status.json");
        auto directory = fetch_directory(ctx, url);
        REQUIRE(directory.has_value());
        CHECK_EQ(directory->size(), 5);
        CHECK_EQ(directory->source(), std::optional<std::string>(url));

        ctx.status_url = url;
        auto from_context = fetch_directory(ctx);
        REQUIRE(from_context.has_value());
        CHECK_EQ(test::urls(from_context.value()), test::urls(directory.value()));
    }

    TEST_CASE("fetch_directory_missing")
    {
        Context ctx;
        auto directory = fetch_directory(ctx, "file:///this/file/does/not/exist.json");
        REQUIRE_FALSE(directory.has_value());
        CHECK_EQ(directory.error().code, ErrorCode::MR_CURL);
        CHECK(directory.error().is_fatal());
    }
}
