#include <tempus/cli/cli.hpp>

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

auto main(int argc, char** argv) -> int {
    CLI::App app{"tempus: leap-second aware RFC 3339 timestamps"};
    app.set_version_flag("--version", "tempus 0.1.0");
    app.require_subcommand(1);

    bool verbose = false;
    bool no_leap_seconds = false;
    std::string display_offset;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");
    app.add_flag("--no-leap-seconds", no_leap_seconds,
                 "Reject a seconds field of 60 in textual timestamps");
    app.add_option("--display-offset", display_offset,
                   "Show results at this offset (Z, +hh:mm or -hh:mm). "
                   "Defaults to TEMPUS_DISPLAY_OFFSET environment variable.");

    std::string inspect_text;
    auto* inspect_cmd = app.add_subcommand("inspect", "Show every representation of a timestamp");
    inspect_cmd->add_option("timestamp", inspect_text, "RFC 3339 timestamp")->required();

    std::string seconds_text;
    auto* seconds_cmd =
        app.add_subcommand("from-seconds", "Timestamp for seconds since 2000-01-01T00:00:00Z");
    seconds_cmd->add_option("seconds", seconds_text, "Decimal seconds")->required();

    std::string diff_lhs;
    std::string diff_rhs;
    auto* diff_cmd = app.add_subcommand("diff", "Seconds from the second timestamp to the first");
    diff_cmd->add_option("lhs", diff_lhs, "RFC 3339 timestamp")->required();
    diff_cmd->add_option("rhs", diff_rhs, "RFC 3339 timestamp")->required();

    CLI11_PARSE(app, argc, argv);

    tempus::cli::CliConfig config;
    config.verbose = verbose;
    config.allow_leap_seconds = !no_leap_seconds;
    tempus::cli::configure_logging(config);

    auto offset =
        tempus::cli::resolve_display_offset(display_offset, std::getenv("TEMPUS_DISPLAY_OFFSET"));
    if (!offset) {
        std::cerr << "tempus: invalid display offset: " << offset.error().format() << "\n";
        return 1;
    }
    config.display_offset = *offset;

    bool ok = false;
    if (inspect_cmd->parsed()) {
        ok = tempus::cli::inspect(inspect_text, config, std::cout);
    } else if (seconds_cmd->parsed()) {
        ok = tempus::cli::from_seconds(seconds_text, config, std::cout);
    } else if (diff_cmd->parsed()) {
        ok = tempus::cli::difference(diff_lhs, diff_rhs, config, std::cout);
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
