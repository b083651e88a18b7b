#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <mirrorrank/context.hpp>
#include <mirrorrank/options.hpp>
#include <mirrorrank/probe_coordinator.hpp>
#include <mirrorrank/prober.hpp>
#include <mirrorrank/render.hpp>
#include <mirrorrank/selection.hpp>
#include <mirrorrank/status.hpp>

using namespace mirrorrank;

int
handle_list_countries(const Directory& directory)
{
    std::cout << country_report(directory);
    return 0;
}

int
handle_select(const Context& ctx, Directory directory, const Options& options)
{
    auto prober = std::make_shared<CurlProber>(ctx);
    ProbeCoordinator coordinator(prober);

    Selection selection = select_endpoints(std::move(directory), options, coordinator);
    for (const auto& outcome : selection.outcomes)
    {
        if (outcome.rate)
            spdlog::info("{}: {:.3f} kB/s", outcome.url, outcome.rate.value());
        else
            spdlog::info("{}: {}", outcome.url, outcome.rate.error().reason);
    }

    const std::string content = mirrorlist_content(selection.directory, options.number);
    if (options.save.empty())
    {
        std::cout << content;
        return 0;
    }

    auto written = write_mirrorlist(options.save, content);
    if (!written)
    {
        written.error().log();
        return 1;
    }
    return 0;
}

// Values set on the command line win over the ones of the configuration file.
void
merge_command_line(const CLI::App& app, const Options& cli, Options& options)
{
    if (app.count("--url"))
        options.url = cli.url;
    if (app.count("--number"))
        options.number = cli.number;
    if (app.count("--isos"))
        options.criteria.isos = cli.criteria.isos;
    if (app.count("--ipv4"))
        options.criteria.ipv4 = cli.criteria.ipv4;
    if (app.count("--ipv6"))
        options.criteria.ipv6 = cli.criteria.ipv6;
    if (app.count("--timeout"))
        options.probe_timeout = cli.probe_timeout;
    if (app.count("--probe-count"))
        options.probe_count = cli.probe_count;
    if (app.count("--save"))
        options.save = cli.save;
    if (app.count("--header"))
        options.headers = cli.headers;
    if (app.count("--cacert"))
        options.cacert = cli.cacert;
    options.list_countries = cli.list_countries;
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Retrieve, filter and rank Arch Linux mirrors" };

    Options cli;
    std::string config_file;
    std::string sort_name;
    double max_age = 0;
    std::vector<std::string> protocol_names;
    bool verbose = false;
    bool disable_ssl = false;

    app.add_option("-f,--file", config_file, "YAML file from which to read the options");
    app.add_option("--url", cli.url, "Url of the mirror status document");
    app.add_option("-n,--number", cli.number, "Number of mirrors to keep");
    app.add_option("--sort", sort_name, "Sort by age, rate, country, score or delay")
        ->check(CLI::IsMember({ "age", "rate", "country", "score", "delay" }));
    app.add_option("-a,--age", max_age, "Only keep mirrors synchronized in the last n hours");
    app.add_flag("--isos", cli.criteria.isos, "Only keep mirrors hosting ISOs");
    app.add_flag("--ipv4", cli.criteria.ipv4, "Only keep mirrors reachable over IPv4");
    app.add_flag("--ipv6", cli.criteria.ipv6, "Only keep mirrors reachable over IPv6");
    app.add_option("-p,--protocol", protocol_names, "Only keep mirrors using these protocols")
        ->check(CLI::IsMember({ "ftp", "https", "http", "rsync" }));
    app.add_option("--timeout", cli.probe_timeout, "Deadline of a probe in seconds");
    app.add_option(
        "--probe-count", cli.probe_count, "Number of mirrors to measure when sorting by rate");
    app.add_option("--save", cli.save, "Write the mirror list to this file");
    app.add_option("-H,--header", cli.headers, "Extra request header, as 'Name: value'");
    app.add_option("--cacert", cli.cacert, "Certificate bundle used to verify peers")
        ->check(CLI::ExistingFile);
    app.add_flag("-l,--list-countries", cli.list_countries, "List countries and exit");
    app.add_flag("-k", disable_ssl, "Disable SSL verification");
    app.add_flag("-v", verbose, "Enable verbose output");

    CLI11_PARSE(app, argc, argv);

    Options options = cli;
    try
    {
        if (!config_file.empty())
        {
            options = Options();
            load_options(fs::path(config_file), options);
            merge_command_line(app, cli, options);
        }
        if (!sort_name.empty())
            options.sort = sort_key_from_string(sort_name).value();
        if (app.count("--age"))
            options.criteria.max_age_hours = max_age;
        if (!protocol_names.empty())
        {
            options.criteria.protocols.clear();
            for (const auto& name : protocol_names)
                options.criteria.protocols.push_back(protocol_from_string(name).value());
        }
    }
    catch (const std::invalid_argument& e)
    {
        spdlog::critical(e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }

    mirrorrank::Context ctx;
    if (verbose)
        ctx.set_verbosity(1);
    else
        ctx.set_log_level(spdlog::level::warn);
    ctx.disable_ssl = disable_ssl;
    try
    {
        configure_context(options, ctx);
    }
    catch (const std::invalid_argument& e)
    {
        spdlog::critical(e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }

    auto directory
        = options.url.empty() ? fetch_directory(ctx) : fetch_directory(ctx, options.url);
    if (!directory)
    {
        directory.error().log();
        std::cerr << directory.error().reason << std::endl;
        return 1;
    }

    if (options.list_countries)
        return handle_list_countries(directory.value());

    return handle_select(ctx, std::move(directory.value()), options);
}
