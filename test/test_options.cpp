#include <fstream>

#include <doctest/doctest.h>

#include <mirrorrank/context.hpp>
#include <mirrorrank/options.hpp>

using namespace mirrorrank;

TEST_SUITE("options")
{
    TEST_CASE("defaults")
    {
        Options options;
        CHECK_EQ(options.sort, SortKey::kSCORE);
        CHECK_EQ(options.number, DEFAULT_NUMBER);
        CHECK_EQ(options.probe_count, DEFAULT_PROBE_COUNT);
        CHECK_FALSE(options.criteria.max_age_hours.has_value());
        CHECK(options.criteria.protocols.empty());
        REQUIRE(options.deadline().has_value());
        CHECK_EQ(options.deadline().value(), std::chrono::seconds(DEFAULT_PROBE_TIMEOUT));
    }

    TEST_CASE("deadline")
    {
        Options options;
        options.probe_timeout = 0;
        CHECK_FALSE(options.deadline().has_value());
        options.probe_timeout = -3;
        CHECK_FALSE(options.deadline().has_value());
        options.probe_timeout = 20;
        CHECK_EQ(options.deadline(), probe_deadline(std::chrono::milliseconds(20000)));
    }

    TEST_CASE("load_yaml")
    {
        Options options;
        load_options(YAML::Load(R"(
url: https://example.org/mirrors/status/json
number: 5
sort: rate
age: 12.5
isos: true
ipv6: true
protocols: [https, RSYNC]
timeout: 2
probe_count: 3
save: /tmp/mirrorlist
)"),
                     options);

        CHECK_EQ(options.url, "https://example.org/mirrors/status/json");
        CHECK_EQ(options.number, 5);
        CHECK_EQ(options.sort, SortKey::kRATE);
        CHECK_EQ(options.criteria.max_age_hours, 12.5);
        CHECK(options.criteria.isos);
        CHECK_FALSE(options.criteria.ipv4);
        CHECK(options.criteria.ipv6);
        CHECK_EQ(options.criteria.protocols,
                 std::vector<Protocol>{ Protocol::kHTTPS, Protocol::kRSYNC });
        CHECK_EQ(options.probe_timeout, 2);
        CHECK_EQ(options.probe_count, 3);
        CHECK_EQ(options.save, fs::path("/tmp/mirrorlist"));
    }

    TEST_CASE("load_partial_yaml")
    {
        Options options;
        options.number = 7;
        load_options(YAML::Load("sort: delay"), options);
        CHECK_EQ(options.sort, SortKey::kDELAY);
        CHECK_EQ(options.number, 7);

        // empty document
        load_options(YAML::Load(""), options);
        CHECK_EQ(options.sort, SortKey::kDELAY);
    }

    TEST_CASE("load_invalid_yaml")
    {
        Options options;
        CHECK_THROWS_AS(load_options(YAML::Load("sort: speed"), options), std::invalid_argument);
        CHECK_THROWS_AS(load_options(YAML::Load("protocols: [gopher]"), options),
                        std::invalid_argument);
        CHECK_THROWS_AS(load_options(YAML::Load("number: -1"), options), std::invalid_argument);
        CHECK_THROWS_AS(load_options(YAML::Load("number: many"), options), std::invalid_argument);
        CHECK_THROWS_AS(load_options(YAML::Load("age: [1, 2]"), options), std::invalid_argument);
        CHECK_THROWS_AS(load_options(YAML::Load("- rate\n- score"), options),
                        std::invalid_argument);
        CHECK_EQ(options.sort, SortKey::kSCORE);
    }

    TEST_CASE("load_file")
    {
        const fs::path path = fs::temp_directory_path() / "mirrorrank_test_options.yaml";
        {
            std::ofstream out(path);
            out << "number: 3\nsort: country\n";
        }
        Options options;
        load_options(path, options);
        CHECK_EQ(options.number, 3);
        CHECK_EQ(options.sort, SortKey::kCOUNTRY);
        fs::remove(path);

        CHECK_THROWS_AS(load_options(fs::path("/this/file/does/not/exist.yaml"), options),
                        std::invalid_argument);
    }

    TEST_CASE("load_transfer_settings")
    {
        Options options;
        load_options(YAML::Load(R"(
headers: ["X-Mirror-Client: ci", "Accept-Language: en"]
cacert: /etc/ssl/certs/ca-certificates.crt
)"),
                     options);
        CHECK_EQ(options.headers,
                 std::vector<std::string>{ "X-Mirror-Client: ci", "Accept-Language: en" });
        CHECK_EQ(options.cacert, fs::path("/etc/ssl/certs/ca-certificates.crt"));

        CHECK_THROWS_AS(load_options(YAML::Load("headers: {a: b}"), options),
                        std::invalid_argument);
    }

    TEST_CASE("configure_context")
    {
        Context ctx;
        ctx.additional_httpheaders.push_back("X-Existing: 1");

        Options options;
        configure_context(options, ctx);
        CHECK_EQ(ctx.additional_httpheaders, std::vector<std::string>{ "X-Existing: 1" });
        CHECK(ctx.ssl_ca_info.empty());

        options.headers = { "X-Mirror-Client: ci" };
        options.cacert = "/etc/ssl/certs/ca-certificates.crt";
        configure_context(options, ctx);
        CHECK_EQ(ctx.additional_httpheaders,
                 std::vector<std::string>{ "X-Existing: 1", "X-Mirror-Client: ci" });
        CHECK_EQ(ctx.ssl_ca_info, fs::path("/etc/ssl/certs/ca-certificates.crt"));

        Options invalid;
        invalid.headers = { "no separator" };
        CHECK_THROWS_AS(configure_context(invalid, ctx), std::invalid_argument);
        invalid.headers = { ": empty name" };
        CHECK_THROWS_AS(configure_context(invalid, ctx), std::invalid_argument);
        CHECK_EQ(ctx.additional_httpheaders.size(), 2);
    }
}
