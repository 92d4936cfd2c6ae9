/**
 * mefw CLI - Entry Point
 *
 * Intel (CS)ME firmware structural parser.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef MEFW_VERSION
#define MEFW_VERSION "unknown"
#endif

namespace mefw::cli::commands {
    void setup_parse(CLI::App* app, GlobalOptions& opts);
    void setup_modules(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace mefw::cli;

    CLI::App app{"mefw - Intel (CS)ME firmware structural parser"};
    app.set_version_flag("-V,--version", MEFW_VERSION);
    app.require_subcommand(0, 1);
    // Global options are accepted after the subcommand as well
    app.fallthrough();

    GlobalOptions opts;

    app.add_option("--config", opts.config, "Parse options JSON file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    auto* parse_cmd = app.add_subcommand("parse", "Decode an image");
    commands::setup_parse(parse_cmd, opts);

    auto* modules_cmd = app.add_subcommand("modules", "List modules");
    commands::setup_modules(modules_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
