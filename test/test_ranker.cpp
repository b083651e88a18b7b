#include <cmath>
#include <limits>

#include <doctest/doctest.h>

#include <mirrorrank/ranker.hpp>

#include "test_helpers.hpp"

using namespace mirrorrank;

namespace
{
    Directory with_rates(const std::vector<std::optional<double>>& rates)
    {
        endpoint_list endpoints;
        for (std::size_t i = 0; i < rates.size(); ++i)
        {
            Endpoint e("https://mirror" + std::to_string(i) + ".org/");
            endpoints.push_back(rates[i] ? e.with_download_rate(rates[i].value()) : e);
        }
        return Directory(std::move(endpoints));
    }

    Directory with_scores(const std::vector<std::optional<double>>& scores)
    {
        endpoint_list endpoints;
        for (std::size_t i = 0; i < scores.size(); ++i)
        {
            EndpointStatus status;
            status.score = scores[i];
            endpoints.emplace_back("https://mirror" + std::to_string(i) + ".org/",
                                   Protocol::kHTTPS,
                                   status);
        }
        return Directory(std::move(endpoints));
    }

    Directory with_countries(const std::vector<std::optional<std::string>>& countries)
    {
        endpoint_list endpoints;
        for (std::size_t i = 0; i < countries.size(); ++i)
        {
            EndpointStatus status;
            status.country = countries[i];
            endpoints.emplace_back("https://mirror" + std::to_string(i) + ".org/",
                                   Protocol::kHTTPS,
                                   status);
        }
        return Directory(std::move(endpoints));
    }
}

TEST_SUITE("ranker")
{
    TEST_CASE("sort_delay")
    {
        auto ranked = rank(test::status_directory(3), SortKey::kDELAY);
        REQUIRE_EQ(ranked.size(), 3);
        CHECK_EQ(ranked[0].delay(), 1863);
        CHECK_EQ(ranked[1].delay(), 6354);
        CHECK_FALSE(ranked[2].delay().has_value());
        CHECK_EQ(ranked[0].url(), "https://mirror.aarnet.edu.au/pub/archlinux/");
        CHECK_EQ(ranked[2].url(), "https://mirrors.rutgers.edu/archlinux/");
    }

    TEST_CASE("sort_age")
    {
        auto ranked = rank(test::status_directory(3), SortKey::kAGE);
        REQUIRE_EQ(ranked.size(), 3);
        // null
        CHECK_EQ(ranked[0].url(), "https://mirrors.rutgers.edu/archlinux/");
        // 2024-04
        CHECK_EQ(ranked[1].url(), "https://mirror.aarnet.edu.au/pub/archlinux/");
        // 2024-05
        CHECK_EQ(ranked[2].url(), "http://ftp.ntua.gr/pub/linux/archlinux/");
    }

    TEST_CASE("sort_rate")
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        auto ranked = rank(with_rates({ std::nullopt, 5.0, nan, 10.0, std::nullopt, 7.5 }),
                           SortKey::kRATE);

        CHECK_EQ(test::urls(ranked),
                 std::vector<std::string>{ "https://mirror3.org/",
                                           "https://mirror5.org/",
                                           "https://mirror1.org/",
                                           "https://mirror0.org/",
                                           "https://mirror2.org/",
                                           "https://mirror4.org/" });
        CHECK(std::isnan(ranked[4].download_rate().value()));
    }

    TEST_CASE("sort_rate_only_invalid")
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        auto directory = with_rates({ nan, std::nullopt, nan });
        const auto before = test::urls(directory);
        CHECK_EQ(test::urls(rank(std::move(directory), SortKey::kRATE)), before);
    }

    TEST_CASE("sort_score_rounds")
    {
        auto ranked = rank(with_scores({ 1.4, std::nullopt, 0.6, 3.0, 1.2, 0.4 }),
                           SortKey::kSCORE);
        // 1.4, 0.6 and 1.2 all round to 1 and keep their relative order
        CHECK_EQ(test::urls(ranked),
                 std::vector<std::string>{ "https://mirror5.org/",
                                           "https://mirror0.org/",
                                           "https://mirror2.org/",
                                           "https://mirror4.org/",
                                           "https://mirror3.org/",
                                           "https://mirror1.org/" });
    }

    TEST_CASE("sort_score_fixture")
    {
        auto ranked = rank(test::status_directory(), SortKey::kSCORE);
        CHECK_EQ(ranked[0].url(), "https://mirror.aarnet.edu.au/pub/archlinux/");
        CHECK_EQ(ranked[4].url(), "https://mirrors.rutgers.edu/archlinux/");
    }

    TEST_CASE("sort_country")
    {
        auto ranked = rank(with_countries({ std::string("Greece"),
                                            std::nullopt,
                                            std::string("australia"),
                                            std::string("Zambia"),
                                            std::string(""),
                                            std::string("Greece") }),
                           SortKey::kCOUNTRY);
        // missing and empty countries compare equal and come first, uppercase before lowercase
        CHECK_EQ(test::urls(ranked),
                 std::vector<std::string>{ "https://mirror1.org/",
                                           "https://mirror4.org/",
                                           "https://mirror0.org/",
                                           "https://mirror5.org/",
                                           "https://mirror3.org/",
                                           "https://mirror2.org/" });
    }

    TEST_CASE("rank_keeps_source")
    {
        auto directory = test::status_directory();
        directory.set_source(std::string("https://example.org/status"));
        auto ranked = rank(std::move(directory), SortKey::kCOUNTRY);
        CHECK_EQ(ranked.source(), std::optional<std::string>("https://example.org/status"));
    }

    TEST_CASE("rank_is_idempotent")
    {
        for (SortKey key :
             { SortKey::kAGE, SortKey::kRATE, SortKey::kCOUNTRY, SortKey::kSCORE, SortKey::kDELAY })
        {
            CAPTURE(to_string(key));
            auto once = rank(test::status_directory(), key);
            const auto once_urls = test::urls(once);
            auto twice = rank(std::move(once), key);
            CHECK_EQ(test::urls(twice), once_urls);
        }
    }

    TEST_CASE("rank_empty")
    {
        CHECK(rank(Directory(), SortKey::kRATE).empty());
    }

    TEST_CASE("rounded_key")
    {
        CHECK_EQ(details::rounded_key(1.5), 2);
        CHECK_EQ(details::rounded_key(-1.5), -2);
        CHECK_EQ(details::rounded_key(6354.0), 6354);
        CHECK_EQ(details::rounded_key(std::nullopt), std::numeric_limits<long long>::max());
        CHECK_EQ(details::rounded_key(std::numeric_limits<double>::quiet_NaN()),
                 std::numeric_limits<long long>::max());
        CHECK_EQ(details::rounded_key(std::numeric_limits<double>::infinity()),
                 std::numeric_limits<long long>::max());
    }

    TEST_CASE("faster_than")
    {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        CHECK(details::faster_than(2.0, 1.0));
        CHECK_FALSE(details::faster_than(1.0, 2.0));
        CHECK(details::faster_than(0.0, nan));
        CHECK(details::faster_than(0.0, std::nullopt));
        CHECK_FALSE(details::faster_than(nan, 0.0));
        CHECK_FALSE(details::faster_than(nan, std::nullopt));
        CHECK_FALSE(details::faster_than(std::nullopt, nan));
    }
}
